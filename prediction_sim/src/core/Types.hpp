#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <vector>
#include <map>

namespace prediction {

    using AgentId = uint64_t;
    using ClueId = uint64_t;
    using Timestamp = uint64_t;
    using Day = int;

    enum class Side {
        YES,
        NO
    };

    enum class AgentRole {
        INSIDER,
        OUTSIDER
    };

    enum class ClueAudience {
        INSIDER,    // Only ever handed to insiders
        ALL         // Insider wave first, then spread to everyone
    };

    enum class ClueTier {
        EARLY,
        MID,
        LATE
    };

    enum class DistributionPhase {
        INSIDER,
        SPREAD
    };

    enum class Stance {
        YES,
        NO,
        NEUTRAL
    };

    enum class GameState {
        NOT_STARTED,
        RUNNING,
        RESOLVING,
        ENDED
    };

    struct Clue {
        ClueId id = 0;
        Day day = 1;
        ClueTier tier = ClueTier::EARLY;
        double reliability = 0.0;
        bool signal = true;          // Side the clue points to (true = YES)
        ClueAudience audience = ClueAudience::ALL;
    };

    // Shared LMSR market. Owned by the engine; agents only see a const view.
    struct MarketState {
        double liquidity = 100.0;    // b
        double quantityYes = 0.0;
        double quantityNo = 0.0;
        double priceYes = 0.5;
        double priceNo = 0.5;
        double totalVolume = 0.0;

        double price(Side side) const { return side == Side::YES ? priceYes : priceNo; }
    };

    struct TradeResult {
        Side side = Side::YES;
        double shares = 0.0;
        double cost = 0.0;
        MarketState before;
        MarketState after;
    };

    struct Action {
        enum class Kind { HOLD, BET };

        Kind kind = Kind::HOLD;
        Side side = Side::YES;
        double amount = 0.0;

        static Action hold() { return Action{}; }
        static Action bet(Side side, double amount) { return Action{ Kind::BET, side, amount }; }
        bool isBet() const { return kind == Kind::BET; }
    };

    struct AgentSnapshot {
        AgentId id = 0;
        std::string name;
        AgentRole role = AgentRole::OUTSIDER;
        std::vector<ClueId> knownClues;
        double yesShares = 0.0;
        double noShares = 0.0;
        int betsPlaced = 0;
        double balance = 0.0;
        double totalSpent = 0.0;
        int reputation = 0;
        double finalPnL = 0.0;

        double position() const { return yesShares - noShares; }
    };

    struct ReputationChange {
        AgentId agentId = 0;
        int before = 0;
        int after = 0;
        int change = 0;
        std::string reason;
    };

    struct DayDiagnostic {
        Day day = 0;
        AgentId agentId = 0;
        std::string message;
    };

    struct RoleStats {
        uint64_t betsPlaced = 0;
        uint64_t yesBets = 0;
        uint64_t noBets = 0;
        double sharesBought = 0;
        double cashSpent = 0;
    };

    inline Side sideFor(bool outcome) { return outcome ? Side::YES : Side::NO; }

    inline std::string toString(Side side) { return side == Side::YES ? "YES" : "NO"; }

    inline std::string toString(AgentRole role) { return role == AgentRole::INSIDER ? "insider" : "outsider"; }

    inline std::string toString(ClueAudience audience) { return audience == ClueAudience::INSIDER ? "insider" : "all"; }

    inline std::string toString(DistributionPhase phase) { return phase == DistributionPhase::INSIDER ? "insider" : "spread"; }

    inline std::string toString(ClueTier tier) {
        switch (tier) {
        case ClueTier::EARLY: return "early";
        case ClueTier::MID: return "mid";
        case ClueTier::LATE: return "late";
        }
        return "early";
    }

    inline std::string toString(Stance stance) {
        switch (stance) {
        case Stance::YES: return "YES";
        case Stance::NO: return "NO";
        case Stance::NEUTRAL: return "NEUTRAL";
        }
        return "NEUTRAL";
    }

    inline std::string toString(GameState state) {
        switch (state) {
        case GameState::NOT_STARTED: return "not_started";
        case GameState::RUNNING: return "running";
        case GameState::RESOLVING: return "resolving";
        case GameState::ENDED: return "ended";
        }
        return "not_started";
    }

} // namespace prediction
