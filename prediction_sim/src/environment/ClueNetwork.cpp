#include "ClueNetwork.hpp"
#include <algorithm>
#include <cmath>

namespace prediction {

    ClueNetwork::ClueNetwork(std::vector<Clue> clues)
        : clues_(std::move(clues))
    {
        for (size_t i = 0; i < clues_.size(); ++i) {
            index_[clues_[i].id] = i;
        }
    }

    ClueTier ClueNetwork::tierForDay(Day day, Day duration) {
        // Integer form of (day - 1) < duration / 3 and (day - 1) < 2 * duration / 3
        long long offset = static_cast<long long>(day - 1) * 3;
        if (offset < duration) return ClueTier::EARLY;
        if (offset < 2LL * duration) return ClueTier::MID;
        return ClueTier::LATE;
    }

    std::vector<Day> ClueNetwork::daysInTier(ClueTier tier, Day duration) {
        std::vector<Day> days;
        for (Day d = 1; d <= duration; ++d) {
            if (tierForDay(d, duration) == tier) days.push_back(d);
        }
        return days;
    }

    bool ClueNetwork::drawSignal(bool outcome, double reliability, Random& rng) {
        return rng.bernoulli(reliability) ? outcome : !outcome;
    }

    std::vector<Clue> ClueNetwork::buildClueNetwork(const GameConfig& config, bool outcome, Random& rng) {
        std::vector<Clue> clues;

        for (ClueTier tier : { ClueTier::EARLY, ClueTier::MID, ClueTier::LATE }) {
            const auto& params = config.clues.tier(tier);
            auto days = daysInTier(tier, config.duration);

            for (int i = 0; i < params.count; ++i) {
                Clue clue;
                clue.tier = tier;
                // Short games can leave a band without days; such clues land on the last day
                clue.day = days.empty()
                    ? config.duration
                    : days[static_cast<size_t>(rng.uniformInt(0, static_cast<int>(days.size()) - 1))];
                clue.reliability = rng.uniform(params.reliabilityMin, params.reliabilityMax);
                clue.signal = drawSignal(outcome, clue.reliability, rng);
                clue.audience = params.audience;
                clues.push_back(clue);
            }
        }

        std::stable_sort(clues.begin(), clues.end(),
            [](const Clue& a, const Clue& b) { return a.day < b.day; });

        ClueId nextId = 1;
        for (auto& clue : clues) {
            clue.id = nextId++;
        }
        return clues;
    }

    std::vector<ClueDelivery> ClueNetwork::release(Day day,
        const std::vector<AgentId>& insiders,
        const std::vector<AgentId>& allAgents,
        Random& rng) {
        std::vector<ClueDelivery> deliveries;

        // First wave: today's clues reach a random subset of insiders
        for (const auto& clue : clues_) {
            if (clue.day != day || insiders.empty()) continue;

            size_t reach = static_cast<size_t>(std::ceil(insiderReach_ * insiders.size()));
            reach = std::clamp<size_t>(reach, 1, insiders.size());

            for (AgentId agent : rng.sample(insiders, reach)) {
                deliver(clue, agent, DistributionPhase::INSIDER, deliveries);
            }
        }

        // Second wave: public clues spread to everyone who has not seen them
        for (const auto& clue : clues_) {
            if (clue.audience != ClueAudience::ALL) continue;
            if (clue.day + spreadDelayDays_ != day) continue;

            for (AgentId agent : allAgents) {
                if (!hasSeen(clue.id, agent)) {
                    deliver(clue, agent, DistributionPhase::SPREAD, deliveries);
                }
            }
        }

        return deliveries;
    }

    void ClueNetwork::deliver(const Clue& clue, AgentId agent, DistributionPhase phase,
        std::vector<ClueDelivery>& out) {
        if (!seenBy_[clue.id].insert(agent).second) return;
        totalDeliveries_++;
        out.push_back(ClueDelivery{ clue.id, agent, phase });
    }

    const Clue* ClueNetwork::find(ClueId id) const {
        auto it = index_.find(id);
        return it != index_.end() ? &clues_[it->second] : nullptr;
    }

    std::vector<const Clue*> ClueNetwork::cluesForDay(Day day) const {
        std::vector<const Clue*> result;
        for (const auto& clue : clues_) {
            if (clue.day == day) result.push_back(&clue);
        }
        return result;
    }

    bool ClueNetwork::hasSeen(ClueId clue, AgentId agent) const {
        auto it = seenBy_.find(clue);
        return it != seenBy_.end() && it->second.count(agent) > 0;
    }

    size_t ClueNetwork::audienceSize(ClueId clue) const {
        auto it = seenBy_.find(clue);
        return it != seenBy_.end() ? it->second.size() : 0;
    }

} // namespace prediction
