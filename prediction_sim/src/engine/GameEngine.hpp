#pragma once

#include "core/Types.hpp"
#include "core/GameConfig.hpp"
#include "core/SimClock.hpp"
#include "agents/Agent.hpp"
#include "environment/ClueNetwork.hpp"
#include "engine/EventLog.hpp"
#include "utils/Random.hpp"
#include <map>
#include <memory>
#include <vector>

namespace prediction {

    // Owns the single MarketState, the agents and the clue network of one
    // game and executes the per-day procedure. Lifecycle rules live in
    // GameSimulator; the engine assumes it is called in order.
    class GameEngine {
    public:
        GameEngine(const GameConfig& config, Random& rng, EventLog& log, SimClock& clock);
        GameEngine(const GameEngine&) = delete;
        GameEngine& operator=(const GameEngine&) = delete;

        // Build the clue pool and the population
        void initialize();

        // One full day: day:changed, clue release, agent decisions, checkpoint
        void runDay(Day day);

        // Decision step with agent-level errors downgraded to Hold
        Action decideFor(Agent& agent, Day day);

        // decideFor on a copy of the random stream; leaves no trace in the game
        Action previewFor(Agent& agent, Day day);

        // Execute a bet through the LMSR; emits agent:bet then market:updated
        TradeResult executeBet(Agent& agent, Side side, double amount, Day day);

        // Agent management
        Agent* getAgent(AgentId id);
        const std::vector<std::unique_ptr<Agent>>& getAgents() const { return agents_; }
        std::vector<std::unique_ptr<Agent>>& getMutableAgents() { return agents_; }
        void addAgents(std::vector<std::unique_ptr<Agent>> agents);
        int getNumInsiders() const { return static_cast<int>(insiderIds_.size()); }

        // Environment access
        const MarketState& getMarket() const { return market_; }
        ClueNetwork& getClueNetwork() { return clueNetwork_; }
        const ClueNetwork& getClueNetwork() const { return clueNetwork_; }

        // Diagnostics
        const std::vector<DayDiagnostic>& getDiagnostics() const { return diagnostics_; }
        const std::map<AgentRole, RoleStats>& getRoleStats() const { return roleStats_; }
        uint64_t getTotalBets() const { return totalBets_; }

    private:
        const GameConfig& config_;
        Random& rng_;
        EventLog& log_;
        SimClock& clock_;

        MarketState market_;
        ClueNetwork clueNetwork_;
        std::vector<std::unique_ptr<Agent>> agents_;
        std::vector<AgentId> insiderIds_;
        std::vector<AgentId> allIds_;

        std::vector<DayDiagnostic> diagnostics_;
        std::map<AgentRole, RoleStats> roleStats_;
        uint64_t totalBets_ = 0;

        // Deliver the day's clues to agents
        void distributeClues(Day day);

        // Every agent in ascending id order
        void processAgentDecisions(Day day);

        // agent:post checkpoint
        void emitCheckpoint(Day day);
    };

} // namespace prediction
