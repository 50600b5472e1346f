#include "MajorityTrader.hpp"
#include "core/GameError.hpp"

namespace prediction {

    MajorityTrader::MajorityTrader(AgentId id, AgentRole role, double endowment, int reputation,
        const AgentProfile& profile, const GameConfig* config)
        : Agent(id, role, endowment, reputation, profile, config)
    {
    }

    MajorityTrader::Tally MajorityTrader::tally(const ClueNetwork& clues) const {
        Tally t;
        for (ClueId id : knownClues_) {
            const Clue* clue = clues.find(id);
            if (!clue) {
                throw AgentDecisionError(name_ + " knows clue #" + std::to_string(id) +
                    " which is not part of the clue pool");
            }
            if (clue->signal) t.yes++;
            else t.no++;
        }
        return t;
    }

    Action MajorityTrader::decide(const DecisionContext& ctx) {
        if (frozen_) {
            throw GameError(ErrorKind::POST_RESOLUTION, name_ + " is settled and cannot decide");
        }

        if (balance_ <= 0.0) return Action::hold();
        if (!shouldReconsider(ctx.day, ctx.duration)) return Action::hold();

        Tally t = tally(ctx.clues);
        if (t.yes == t.no) return Action::hold();

        if (!ctx.rng.bernoulli(profile_.betProbability)) return Action::hold();

        double amount = drawBetAmount(ctx.rng);
        if (amount <= 0.0) return Action::hold();

        return Action::bet(t.yes > t.no ? Side::YES : Side::NO, amount);
    }

} // namespace prediction
