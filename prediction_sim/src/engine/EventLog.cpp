#include "EventLog.hpp"
#include "core/GameError.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <exception>

namespace prediction {

    EventLog::EventLog(SimClock& clock)
        : clock_(clock)
    {
    }

    const GameEvent& EventLog::emit(Day day, EventPayload payload) {
        if (dispatching_) {
            throw GameError(ErrorKind::INVALID_STATE,
                "cannot emit " + toString(typeOf(payload)) + " from inside an event handler");
        }

        GameEvent event;
        event.sequence = events_.size();
        event.type = typeOf(payload);
        event.day = day;
        event.timestamp = clock_.stamp();
        event.payload = std::move(payload);

        events_.push_back(std::move(event));

        // No emission happens during dispatch, so the reference stays valid
        const GameEvent& stored = events_.back();
        dispatch(stored);
        return stored;
    }

    EventLog::SubscriptionId EventLog::on(EventType type, Handler handler) {
        SubscriptionId id = nextSubscription_++;
        subscriptions_[id] = Subscription{ false, type, std::move(handler) };
        return id;
    }

    EventLog::SubscriptionId EventLog::onAny(Handler handler) {
        SubscriptionId id = nextSubscription_++;
        subscriptions_[id] = Subscription{ true, EventType::GAME_STARTED, std::move(handler) };
        return id;
    }

    bool EventLog::off(SubscriptionId id) {
        return subscriptions_.erase(id) > 0;
    }

    void EventLog::addSink(EventSink* sink) {
        if (sink && std::find(sinks_.begin(), sinks_.end(), sink) == sinks_.end()) {
            sinks_.push_back(sink);
        }
    }

    size_t EventLog::count(EventType type) const {
        return static_cast<size_t>(std::count_if(events_.begin(), events_.end(),
            [type](const GameEvent& e) { return e.type == type; }));
    }

    void EventLog::dispatch(const GameEvent& event) {
        struct DispatchGuard {
            bool& flag;
            explicit DispatchGuard(bool& f) : flag(f) { flag = true; }
            ~DispatchGuard() { flag = false; }
        } guard(dispatching_);

        // Snapshot so handlers may subscribe/unsubscribe while being called
        std::vector<Handler> handlers;
        for (const auto& [_, sub] : subscriptions_) {
            if (sub.any || sub.type == event.type) {
                handlers.push_back(sub.handler);
            }
        }

        for (auto& handler : handlers) {
            try {
                handler(event);
            }
            catch (const std::exception& e) {
                Logger::warn("Event handler for {} (seq {}) failed: {}",
                    toString(event.type), event.sequence, e.what());
            }
        }

        for (auto* sink : sinks_) {
            try {
                sink->onEvent(event);
            }
            catch (const std::exception& e) {
                Logger::warn("Event sink for {} (seq {}) failed: {}",
                    toString(event.type), event.sequence, e.what());
            }
        }
    }

} // namespace prediction
