#pragma once

#include "core/Types.hpp"
#include "core/GameConfig.hpp"
#include "utils/Random.hpp"
#include <vector>
#include <map>
#include <set>

namespace prediction {

    struct ClueDelivery {
        ClueId clueId = 0;
        AgentId agentId = 0;
        DistributionPhase phase = DistributionPhase::INSIDER;
    };

    // Fixed pool of clues for one game plus the mutable "who has seen what"
    // relation. The pool is immutable once built; only `release()` grows the
    // relation.
    class ClueNetwork {
    public:
        ClueNetwork() = default;
        explicit ClueNetwork(std::vector<Clue> clues);

        // Build the whole pool: per tier `count` clues on random days of the
        // tier's band, reliability uniform in the band, signal == outcome with
        // probability = reliability. Sorted by day, ids 1..N.
        static std::vector<Clue> buildClueNetwork(const GameConfig& config, bool outcome, Random& rng);

        // Band of a day: first third early, second third mid, rest late
        static ClueTier tierForDay(Day day, Day duration);

        // Days of [1, duration] that fall in `tier`
        static std::vector<Day> daysInTier(ClueTier tier, Day duration);

        // The only place randomness touches ground truth
        static bool drawSignal(bool outcome, double reliability, Random& rng);

        // Deliveries due on `day`: today's clues to a random subset of
        // insiders first, then clues whose spread delay elapsed to every agent
        // that has not seen them. Both lists of ids must be ascending.
        std::vector<ClueDelivery> release(Day day,
            const std::vector<AgentId>& insiders,
            const std::vector<AgentId>& allAgents,
            Random& rng);

        const std::vector<Clue>& getClues() const { return clues_; }
        const Clue* find(ClueId id) const;
        std::vector<const Clue*> cluesForDay(Day day) const;

        bool hasSeen(ClueId clue, AgentId agent) const;
        size_t audienceSize(ClueId clue) const;
        size_t totalDeliveries() const { return totalDeliveries_; }

        void setInsiderReach(double reach) { insiderReach_ = reach; }
        void setSpreadDelay(int days) { spreadDelayDays_ = days; }

    private:
        std::vector<Clue> clues_;
        std::map<ClueId, size_t> index_;
        std::map<ClueId, std::set<AgentId>> seenBy_;
        size_t totalDeliveries_ = 0;

        double insiderReach_ = 0.5;
        int spreadDelayDays_ = 1;

        void deliver(const Clue& clue, AgentId agent, DistributionPhase phase,
            std::vector<ClueDelivery>& out);
    };

} // namespace prediction
