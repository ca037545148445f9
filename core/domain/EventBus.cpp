#include "EventBus.hpp"
#include <algorithm>
#include <iostream>

namespace senate::domain {

EventBus::EventBus(std::size_t maxHistory)
    : maxHistory_(maxHistory) {
}

bool EventBus::publish(EventPtr event) {
    if (!event) return false;

    for (const auto& [id, filter] : filters_) {
        if (!filter(*event)) {
            return false;
        }
    }

    record(event);

    // Snapshot so handlers may subscribe, unsubscribe or publish re-entrantly.
    // A subscriber removed mid-dispatch is skipped.
    auto handlers = handlersFor(event->type);
    for (const auto& subscriber : handlers) {
        if (!isRegistered(event->type, subscriber.order)) {
            continue;
        }
        try {
            subscriber.handler(event);
        } catch (const std::exception& e) {
            std::cerr << "[EventBus] Handler failure: event=" << event->id
                      << " type=" << eventTypeToString(event->type)
                      << " handler=" << subscriber.id
                      << " error=" << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[EventBus] Handler failure: event=" << event->id
                      << " type=" << eventTypeToString(event->type)
                      << " handler=" << subscriber.id
                      << " error=non-standard exception" << std::endl;
        }
    }

    return true;
}

void EventBus::record(const EventPtr& event) {
    if (maxHistory_ == 0) return;

    std::string referenced = event->referencedEventId();
    if ((event->type == EventType::Reaction || event->type == EventType::Interjection) &&
        historyIds_.find(referenced) == historyIds_.end()) {
        orphans_.insert(event->id);
        std::cerr << "[EventBus] Orphan reference: event=" << event->id
                  << " type=" << eventTypeToString(event->type)
                  << " references=" << (referenced.empty() ? "<none>" : referenced) << std::endl;
    }

    history_.push_back(event);
    historyIds_.insert(event->id);

    while (history_.size() > maxHistory_) {
        const auto& oldest = history_.front();
        auto it = historyIds_.find(oldest->id);
        if (it != historyIds_.end()) {
            historyIds_.erase(it);
        }
        orphans_.erase(oldest->id);
        history_.pop_front();
    }
}

std::vector<EventBus::Subscriber> EventBus::handlersFor(EventType eventType) const {
    std::vector<Subscriber> result;

    auto it = handlers_.find(eventType);
    if (it != handlers_.end()) {
        result = it->second;
    }
    result.insert(result.end(), wildcardHandlers_.begin(), wildcardHandlers_.end());

    std::stable_sort(result.begin(), result.end(), [](const Subscriber& a, const Subscriber& b) {
        if (a.priority != b.priority) return a.priority > b.priority;
        return a.order < b.order;
    });
    return result;
}

bool EventBus::isRegistered(EventType eventType, std::uint64_t order) const {
    auto matches = [order](const Subscriber& s) { return s.order == order; };

    auto it = handlers_.find(eventType);
    if (it != handlers_.end() && std::any_of(it->second.begin(), it->second.end(), matches)) {
        return true;
    }
    return std::any_of(wildcardHandlers_.begin(), wildcardHandlers_.end(), matches);
}

bool EventBus::subscribe(EventType eventType, const std::string& subscriberId,
                         Handler handler, int priority) {
    auto& list = handlers_[eventType];
    if (contains(list, subscriberId)) {
        return false;
    }
    list.push_back({subscriberId, std::move(handler), priority, nextOrder_++});
    return true;
}

bool EventBus::subscribeToAll(const std::string& subscriberId, Handler handler, int priority) {
    if (contains(wildcardHandlers_, subscriberId)) {
        return false;
    }
    wildcardHandlers_.push_back({subscriberId, std::move(handler), priority, nextOrder_++});
    return true;
}

bool EventBus::unsubscribe(EventType eventType, const std::string& subscriberId) {
    auto it = handlers_.find(eventType);
    if (it == handlers_.end()) {
        return false;
    }
    bool removed = remove(it->second, subscriberId);
    if (it->second.empty()) {
        handlers_.erase(it);
    }
    return removed;
}

void EventBus::unsubscribeAll(const std::string& subscriberId) {
    for (auto it = handlers_.begin(); it != handlers_.end();) {
        remove(it->second, subscriberId);
        if (it->second.empty()) {
            it = handlers_.erase(it);
        } else {
            ++it;
        }
    }
    remove(wildcardHandlers_, subscriberId);
}

EventBus::FilterId EventBus::addFilter(Filter filter) {
    FilterId id = nextFilterId_++;
    filters_.emplace(id, std::move(filter));
    return id;
}

bool EventBus::removeFilter(FilterId id) {
    return filters_.erase(id) > 0;
}

std::vector<EventPtr> EventBus::getRecentEvents(std::size_t count) const {
    std::size_t n = std::min(count, history_.size());
    return std::vector<EventPtr>(history_.end() - static_cast<std::ptrdiff_t>(n), history_.end());
}

void EventBus::clearHistory() {
    history_.clear();
    historyIds_.clear();
    orphans_.clear();
}

bool EventBus::isOrphan(const std::string& eventId) const {
    return orphans_.count(eventId) > 0;
}

std::size_t EventBus::subscriberCount(EventType eventType) const {
    auto it = handlers_.find(eventType);
    return it == handlers_.end() ? 0 : it->second.size();
}

bool EventBus::contains(const std::vector<Subscriber>& list, const std::string& subscriberId) {
    return std::any_of(list.begin(), list.end(), [&](const Subscriber& s) {
        return s.id == subscriberId;
    });
}

bool EventBus::remove(std::vector<Subscriber>& list, const std::string& subscriberId) {
    auto it = std::remove_if(list.begin(), list.end(), [&](const Subscriber& s) {
        return s.id == subscriberId;
    });
    bool removed = it != list.end();
    list.erase(it, list.end());
    return removed;
}

} // namespace senate::domain
