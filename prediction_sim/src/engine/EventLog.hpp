#pragma once

#include "core/Events.hpp"
#include "core/SimClock.hpp"
#include <functional>
#include <map>
#include <vector>

namespace prediction {

    // Injected observer of the event stream
    class EventSink {
    public:
        virtual ~EventSink() = default;
        virtual void onEvent(const GameEvent& event) = 0;
    };

    // Append-only, strictly ordered record of one game. Observers receive a
    // const reference to each event right after it is appended; they cannot
    // reach market or agent state through it.
    class EventLog {
    public:
        using Handler = std::function<void(const GameEvent&)>;
        using SubscriptionId = uint64_t;

        explicit EventLog(SimClock& clock);
        EventLog(const EventLog&) = delete;
        EventLog& operator=(const EventLog&) = delete;

        // Stamp, append and dispatch
        const GameEvent& emit(Day day, EventPayload payload);

        // Subscriptions
        SubscriptionId on(EventType type, Handler handler);
        SubscriptionId onAny(Handler handler);
        bool off(SubscriptionId id);
        void addSink(EventSink* sink);

        const std::vector<GameEvent>& getEvents() const { return events_; }
        size_t size() const { return events_.size(); }
        size_t count(EventType type) const;

        // True while handlers are running
        bool isDispatching() const { return dispatching_; }

    private:
        struct Subscription {
            bool any = false;
            EventType type = EventType::GAME_STARTED;
            Handler handler;
        };

        SimClock& clock_;
        std::vector<GameEvent> events_;
        std::map<SubscriptionId, Subscription> subscriptions_;
        std::vector<EventSink*> sinks_;
        SubscriptionId nextSubscription_ = 1;
        bool dispatching_ = false;

        void dispatch(const GameEvent& event);
    };

} // namespace prediction
