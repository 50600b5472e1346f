#pragma once

#include "GameEngine.hpp"
#include "EventLog.hpp"
#include "core/GameConfig.hpp"
#include "core/Events.hpp"
#include "core/SimClock.hpp"
#include "utils/Random.hpp"
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace prediction {

    // One autonomous game: NOT_STARTED -> RUNNING(day 1..duration) ->
    // RESOLVING -> ENDED. Construction validates the configuration and throws
    // GameError(CONFIGURATION) before any state exists.
    class GameSimulator {
    public:
        explicit GameSimulator(const GameConfig& config);
        GameSimulator(const GameSimulator&) = delete;
        GameSimulator& operator=(const GameSimulator&) = delete;

        // Run start-to-finish and return the result
        GameResult runCompleteGame();

        // Step mode
        void start();
        bool stepDay();               // false once every day has run
        GameResult resolve();

        // Caller-driven decision/trade between days. decide() is a preview:
        // it neither records anything nor advances the game's random stream.
        Action decide(AgentId agentId);
        TradeResult placeBet(AgentId agentId, Side side, double amount);

        // Observation
        EventLog::SubscriptionId on(EventType type, EventLog::Handler handler);
        EventLog::SubscriptionId onAny(EventLog::Handler handler);
        bool off(EventLog::SubscriptionId id);
        void addSink(EventSink* sink);

        // Status
        GameState getState() const { return state_; }
        Day getCurrentDay() const { return currentDay_; }
        const std::string& getGameId() const { return gameId_; }
        const std::string& getQuestion() const { return question_; }
        const GameConfig& getConfig() const { return config_; }
        const MarketState& getMarket() const { return engine_.getMarket(); }
        const std::vector<GameEvent>& getEvents() const { return log_.getEvents(); }
        const std::vector<DayDiagnostic>& getDiagnostics() const { return engine_.getDiagnostics(); }
        const std::optional<GameResult>& getResult() const { return result_; }
        const GameEngine& getEngine() const { return engine_; }

        // Get state as JSON
        nlohmann::json getStateJson() const;

        static const std::vector<std::string>& questionTopics();

    private:
        GameConfig config_;
        Random rng_;
        SimClock clock_;
        EventLog log_;
        GameEngine engine_;

        GameState state_ = GameState::NOT_STARTED;
        Day currentDay_ = 0;
        std::string gameId_;
        std::string question_;
        std::optional<GameResult> result_;

        // Rejects calls that do not fit the current state
        void requireRunning(const char* operation) const;
        Agent& requireAgent(AgentId id);

        std::string generateGameId();
        std::string generateQuestion();
    };

    // Validated construction
    std::unique_ptr<GameSimulator> newGame(const GameConfig& config);

} // namespace prediction
