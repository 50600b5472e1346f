#pragma once

#include "core/Types.hpp"
#include "core/GameConfig.hpp"
#include "environment/ClueNetwork.hpp"
#include "utils/Random.hpp"
#include <memory>
#include <string>
#include <vector>

namespace prediction {

    // Behavioural profile drawn once per agent
    struct AgentProfile {
        double betProbability = 0.5;   // chance to act on a conviction when reconsidering
        int reconsiderPhase = 0;       // offset of the periodic trigger
    };

    // Read-only view handed to an agent's decision step
    struct DecisionContext {
        const ClueNetwork& clues;
        const MarketState& market;
        Day day;
        Day duration;
        Random& rng;
    };

    class Agent {
    public:
        Agent(AgentId id, AgentRole role, double endowment, int reputation,
            const AgentProfile& profile, const GameConfig* config = nullptr);
        virtual ~Agent() = default;

        // Pure virtual: each agent type implements its own strategy.
        // Throws AgentDecisionError when its knowledge is inconsistent.
        virtual Action decide(const DecisionContext& ctx) = 0;

        // Agent type identifier
        virtual std::string getType() const = 0;

        // Knowledge grows append-only
        void receiveClue(ClueId clue, Day day);

        // Called when a bet of this agent was executed
        virtual void onFill(const TradeResult& fill);

        // Final P&L and reputation; freezes the agent
        void settle(double finalPnL, int reputationDelta);

        // Getters
        AgentId getId() const { return id_; }
        const std::string& getName() const { return name_; }
        AgentRole getRole() const { return role_; }
        bool isInsider() const { return role_ == AgentRole::INSIDER; }
        const std::vector<ClueId>& getKnownClues() const { return knownClues_; }
        double getYesShares() const { return yesShares_; }
        double getNoShares() const { return noShares_; }
        double getNetPosition() const { return yesShares_ - noShares_; }
        int getBetsPlaced() const { return betsPlaced_; }
        double getBalance() const { return balance_; }
        double getTotalSpent() const { return totalSpent_; }
        int getReputation() const { return reputation_; }
        double getFinalPnL() const { return finalPnL_; }
        bool isFrozen() const { return frozen_; }
        const AgentProfile& getProfile() const { return profile_; }

        Stance getStance() const;
        AgentSnapshot snapshot() const;

    protected:
        AgentId id_;
        std::string name_;
        AgentRole role_;
        AgentProfile profile_;
        const GameConfig* config_ = nullptr;

        std::vector<ClueId> knownClues_;
        Day lastClueDay_ = 0;

        double yesShares_ = 0.0;
        double noShares_ = 0.0;
        int betsPlaced_ = 0;
        double balance_;
        double totalSpent_ = 0.0;
        int reputation_;
        double finalPnL_ = 0.0;
        bool frozen_ = false;

        // Periodic trigger, or fresh clues when the agent reacts to them
        bool shouldReconsider(Day day, Day duration) const;

        // Uniform in the configured band, clamped to the remaining balance
        double drawBetAmount(Random& rng) const;

        void requireMutable(const char* operation) const;
    };

    // Factory for creating the game's population
    class AgentFactory {
    public:
        static std::unique_ptr<Agent> createMajorityTrader(AgentId id, AgentRole role,
            const GameConfig& config, Random& rng);

        // Ids 1..numAgents; the first floor(numAgents * insiderPercentage) are insiders
        static std::vector<std::unique_ptr<Agent>> createPopulation(const GameConfig& config, Random& rng);

    private:
        static AgentProfile generateProfile(const GameConfig& config, Random& rng);
    };

} // namespace prediction
