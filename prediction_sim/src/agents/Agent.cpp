#include "Agent.hpp"
#include "MajorityTrader.hpp"
#include "core/GameError.hpp"
#include <algorithm>
#include <cmath>

namespace prediction {

    namespace {
        // Net positions this close to zero count as flat
        constexpr double FLAT_EPSILON = 1e-9;

        // Rounding residue below this is treated as an empty balance
        constexpr double BALANCE_EPSILON = 1e-6;
    }

    Agent::Agent(AgentId id, AgentRole role, double endowment, int reputation,
        const AgentProfile& profile, const GameConfig* config)
        : id_(id)
        , name_("Agent " + std::to_string(id))
        , role_(role)
        , profile_(profile)
        , config_(config)
        , balance_(endowment)
        , reputation_(reputation)
    {
    }

    void Agent::receiveClue(ClueId clue, Day day) {
        requireMutable("receive a clue");
        knownClues_.push_back(clue);
        lastClueDay_ = std::max(lastClueDay_, day);
    }

    void Agent::onFill(const TradeResult& fill) {
        requireMutable("take a fill");

        if (fill.side == Side::YES) {
            yesShares_ += fill.shares;
        }
        else {
            noShares_ += fill.shares;
        }

        // The charge equals the drawn amount up to rounding; never go below zero
        balance_ -= fill.cost;
        if (balance_ < BALANCE_EPSILON) balance_ = 0.0;
        totalSpent_ += fill.cost;
        betsPlaced_++;
    }

    void Agent::settle(double finalPnL, int reputationDelta) {
        requireMutable("settle");
        finalPnL_ = finalPnL;
        reputation_ += reputationDelta;
        frozen_ = true;
    }

    Stance Agent::getStance() const {
        double net = getNetPosition();
        if (net > FLAT_EPSILON) return Stance::YES;
        if (net < -FLAT_EPSILON) return Stance::NO;
        return Stance::NEUTRAL;
    }

    AgentSnapshot Agent::snapshot() const {
        AgentSnapshot s;
        s.id = id_;
        s.name = name_;
        s.role = role_;
        s.knownClues = knownClues_;
        s.yesShares = yesShares_;
        s.noShares = noShares_;
        s.betsPlaced = betsPlaced_;
        s.balance = balance_;
        s.totalSpent = totalSpent_;
        s.reputation = reputation_;
        s.finalPnL = finalPnL_;
        return s;
    }

    bool Agent::shouldReconsider(Day day, Day duration) const {
        bool reactToClues = config_ ? config_->betting.reactToNewClues : true;
        if (reactToClues && lastClueDay_ == day) {
            return true;
        }

        ClueTier tier = ClueNetwork::tierForDay(day, duration);
        int every = config_ ? config_->betting.reconsiderEvery(tier)
            : (tier == ClueTier::EARLY ? 5 : tier == ClueTier::MID ? 3 : 1);
        return (day + profile_.reconsiderPhase) % every == 0;
    }

    double Agent::drawBetAmount(Random& rng) const {
        double minBet = config_ ? config_->betting.minBet : 50.0;
        double maxBet = config_ ? config_->betting.maxBet : 150.0;

        double amount = std::floor(rng.uniform(minBet, maxBet + 1.0));
        amount = std::clamp(amount, minBet, maxBet);
        return std::min(amount, balance_);
    }

    void Agent::requireMutable(const char* operation) const {
        if (frozen_) {
            throw GameError(ErrorKind::POST_RESOLUTION,
                name_ + " is settled and cannot " + operation);
        }
    }

    // AgentFactory implementation

    AgentProfile AgentFactory::generateProfile(const GameConfig& config, Random& rng) {
        AgentProfile profile;
        profile.betProbability = rng.uniform(config.agents.betProbabilityMin, config.agents.betProbabilityMax);
        int longest = std::max({ config.betting.reconsiderEarly, config.betting.reconsiderMid,
            config.betting.reconsiderLate });
        profile.reconsiderPhase = rng.uniformInt(0, longest - 1);
        return profile;
    }

    std::unique_ptr<Agent> AgentFactory::createMajorityTrader(AgentId id, AgentRole role,
        const GameConfig& config, Random& rng) {
        return std::make_unique<MajorityTrader>(id, role, config.agents.endowment,
            config.agents.initialReputation, generateProfile(config, rng), &config);
    }

    std::vector<std::unique_ptr<Agent>> AgentFactory::createPopulation(const GameConfig& config, Random& rng) {
        std::vector<std::unique_ptr<Agent>> agents;
        int numInsiders = config.numInsiders();

        for (int i = 0; i < config.numAgents; ++i) {
            AgentId id = static_cast<AgentId>(i + 1);
            AgentRole role = i < numInsiders ? AgentRole::INSIDER : AgentRole::OUTSIDER;
            agents.push_back(createMajorityTrader(id, role, config, rng));
        }

        return agents;
    }

} // namespace prediction
