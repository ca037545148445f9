#pragma once

#include "../Event.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace senate::ports {

class IEventBus {
public:
    virtual ~IEventBus() = default;

    using Handler = std::function<void(const EventPtr&)>;
    using Filter = std::function<bool(const Event&)>;
    using FilterId = std::size_t;

    // Returns false when the event was rejected by a filter.
    virtual bool publish(EventPtr event) = 0;

    // A subscriber is identified by subscriberId; re-subscribing the same id
    // to the same type is a no-op and returns false.
    virtual bool subscribe(EventType eventType, const std::string& subscriberId,
                           Handler handler, int priority = 0) = 0;
    virtual bool subscribeToAll(const std::string& subscriberId, Handler handler, int priority = 0) = 0;
    virtual bool unsubscribe(EventType eventType, const std::string& subscriberId) = 0;
    virtual void unsubscribeAll(const std::string& subscriberId) = 0;

    virtual FilterId addFilter(Filter filter) = 0;
    virtual bool removeFilter(FilterId id) = 0;

    virtual std::vector<EventPtr> getRecentEvents(std::size_t count) const = 0;
    virtual void clearHistory() = 0;
};

} // namespace senate::ports
