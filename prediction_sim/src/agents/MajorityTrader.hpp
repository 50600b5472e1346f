#pragma once

#include "Agent.hpp"
#include <string>

namespace prediction {

    // Bets with the majority of the signals it has seen. Conviction picks
    // the side and whether to bet at all; the amount is drawn independently.
    class MajorityTrader : public Agent {
    public:
        MajorityTrader(AgentId id, AgentRole role, double endowment, int reputation,
            const AgentProfile& profile, const GameConfig* config = nullptr);

        Action decide(const DecisionContext& ctx) override;
        std::string getType() const override { return "MajorityTrader"; }

        struct Tally {
            int yes = 0;
            int no = 0;
        };

        // Count YES/NO signals over the known clues
        Tally tally(const ClueNetwork& clues) const;
    };

} // namespace prediction
