#pragma once

#include "../ports/IEventBus.hpp"
#include <cstdint>
#include <deque>
#include <map>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace senate::domain {

// Synchronous, priority-ordered dispatcher with a bounded FIFO history.
// Not safe for concurrent publish from several threads; use one bus per debate.
class EventBus : public ports::IEventBus {
public:
    static constexpr std::size_t DEFAULT_MAX_HISTORY = 100;

    explicit EventBus(std::size_t maxHistory = DEFAULT_MAX_HISTORY);
    ~EventBus() override = default;

    bool publish(EventPtr event) override;

    bool subscribe(EventType eventType, const std::string& subscriberId,
                   Handler handler, int priority = 0) override;
    bool subscribeToAll(const std::string& subscriberId, Handler handler, int priority = 0) override;
    bool unsubscribe(EventType eventType, const std::string& subscriberId) override;
    void unsubscribeAll(const std::string& subscriberId) override;

    FilterId addFilter(Filter filter) override;
    bool removeFilter(FilterId id) override;

    std::vector<EventPtr> getRecentEvents(std::size_t count) const override;
    void clearHistory() override;

    bool isOrphan(const std::string& eventId) const;
    std::size_t historySize() const { return history_.size(); }
    std::size_t maxHistory() const { return maxHistory_; }
    std::size_t subscriberCount(EventType eventType) const;

private:
    struct Subscriber {
        std::string id;
        Handler handler;
        int priority = 0;
        std::uint64_t order = 0;
    };

    void record(const EventPtr& event);
    std::vector<Subscriber> handlersFor(EventType eventType) const;
    bool isRegistered(EventType eventType, std::uint64_t order) const;
    static bool contains(const std::vector<Subscriber>& list, const std::string& subscriberId);
    static bool remove(std::vector<Subscriber>& list, const std::string& subscriberId);

    std::unordered_map<EventType, std::vector<Subscriber>> handlers_;
    std::vector<Subscriber> wildcardHandlers_;
    std::map<FilterId, Filter> filters_;
    FilterId nextFilterId_ = 1;
    std::uint64_t nextOrder_ = 0;

    std::size_t maxHistory_;
    std::deque<EventPtr> history_;
    std::unordered_multiset<std::string> historyIds_;
    std::unordered_set<std::string> orphans_;
};

} // namespace senate::domain
