#pragma once

#include "Types.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace prediction {

    struct GameStartedPayload {
        std::string gameId;
        std::string question;
        int numAgents = 0;
        int numInsiders = 0;
        int duration = 0;
        double liquidityParameter = 0.0;
    };

    struct DayChangedPayload {
        Day day = 0;
    };

    struct ClueDistributedPayload {
        ClueId clueId = 0;
        AgentId agentId = 0;
        bool signal = true;
        double reliability = 0.0;
        ClueTier tier = ClueTier::EARLY;
        DistributionPhase phase = DistributionPhase::INSIDER;
    };

    struct AgentBetPayload {
        AgentId agentId = 0;
        Side side = Side::YES;
        double amount = 0.0;
        double shares = 0.0;
        double cost = 0.0;
        double priceBefore = 0.0;    // price of `side` before the trade
        double priceAfter = 0.0;
    };

    // Checkpoint for downstream narrative generation; carries no text
    struct AgentPostPayload {
        AgentId agentId = 0;
        Stance stance = Stance::NEUTRAL;
        int betsPlaced = 0;
        double priceYes = 0.5;
        double priceNo = 0.5;
        double totalVolume = 0.0;
    };

    struct MarketUpdatedPayload {
        MarketState market;
    };

    struct OutcomeRevealedPayload {
        bool outcome = true;
    };

    struct GameEndedPayload {
        bool outcome = true;
        std::vector<AgentId> winners;
        std::vector<AgentId> losers;
        std::vector<ReputationChange> reputationChanges;
        MarketState market;
    };

    // Alternative order defines EventType below
    using EventPayload = std::variant<
        GameStartedPayload,
        DayChangedPayload,
        ClueDistributedPayload,
        AgentBetPayload,
        AgentPostPayload,
        MarketUpdatedPayload,
        OutcomeRevealedPayload,
        GameEndedPayload>;

    enum class EventType {
        GAME_STARTED,
        DAY_CHANGED,
        CLUE_DISTRIBUTED,
        AGENT_BET,
        AGENT_POST,
        MARKET_UPDATED,
        OUTCOME_REVEALED,
        GAME_ENDED
    };

    static_assert(std::variant_size_v<EventPayload> == 8, "EventType and EventPayload out of sync");

    inline EventType typeOf(const EventPayload& payload) {
        return static_cast<EventType>(payload.index());
    }

    inline std::string toString(EventType type) {
        switch (type) {
        case EventType::GAME_STARTED: return "game:started";
        case EventType::DAY_CHANGED: return "day:changed";
        case EventType::CLUE_DISTRIBUTED: return "clue:distributed";
        case EventType::AGENT_BET: return "agent:bet";
        case EventType::AGENT_POST: return "agent:post";
        case EventType::MARKET_UPDATED: return "market:updated";
        case EventType::OUTCOME_REVEALED: return "outcome:revealed";
        case EventType::GAME_ENDED: return "game:ended";
        }
        return "unknown";
    }

    inline std::optional<EventType> eventTypeFromString(const std::string& name) {
        for (int i = 0; i < static_cast<int>(std::variant_size_v<EventPayload>); ++i) {
            auto type = static_cast<EventType>(i);
            if (toString(type) == name) return type;
        }
        return std::nullopt;
    }

    struct GameEvent {
        uint64_t sequence = 0;
        EventType type = EventType::GAME_STARTED;
        Day day = 0;
        Timestamp timestamp = 0;
        EventPayload payload;

        template<typename T>
        const T& as() const { return std::get<T>(payload); }
    };

    struct GameResult {
        std::string id;
        std::string question;
        bool outcome = true;
        Timestamp startTime = 0;
        Timestamp endTime = 0;
        std::vector<GameEvent> events;
        std::vector<AgentSnapshot> agents;
        MarketState market;
        std::vector<AgentId> winners;
        std::vector<AgentId> losers;
        std::vector<ReputationChange> reputationChanges;
    };

} // namespace prediction
