#pragma once

#include "core/Types.hpp"
#include "core/GameConfig.hpp"
#include "agents/Agent.hpp"
#include <memory>
#include <vector>

namespace prediction {

    struct SettlementReport {
        std::vector<AgentId> winners;
        std::vector<AgentId> losers;
        std::vector<ReputationChange> reputationChanges;
        double totalPnL = 0.0;
        double totalPayout = 0.0;
    };

    // Resolution of a finished market. Winners hold a net position on the
    // true side, losers on the other side, flat agents are neither.
    // Reputation moves by a flat amount per class; P&L is the payout of the
    // winning shares minus everything the agent spent. Settles and freezes
    // every agent.
    class Settlement {
    public:
        static SettlementReport settle(const MarketState& market,
            std::vector<std::unique_ptr<Agent>>& agents,
            bool outcome,
            const GameConfig::SettlementParams& params);
    };

} // namespace prediction
