#include "GameSimulator.hpp"
#include "Settlement.hpp"
#include "core/GameError.hpp"
#include "core/Serialization.hpp"
#include "utils/Logger.hpp"
#include <fmt/format.h>

namespace prediction {

    namespace {

        const GameConfig& validated(const GameConfig& config) {
            config.validate();
            return config;
        }

    } // namespace

    GameSimulator::GameSimulator(const GameConfig& config)
        : config_(validated(config))
        , rng_(config_.seed)
        , log_(clock_)
        , engine_(config_, rng_, log_, clock_)
    {
        try {
            clock_.initialize(config_.startDate);
        }
        catch (const std::runtime_error& e) {
            throw GameError(ErrorKind::CONFIGURATION, e.what());
        }
        Logger::info("Game created: {} agents, {} days, b = {}, insiders {:.0f}%, seed {}",
            config_.numAgents, config_.duration, config_.liquidityParameter,
            config_.insiderPercentage * 100.0, config_.seed);
    }

    std::unique_ptr<GameSimulator> newGame(const GameConfig& config) {
        return std::make_unique<GameSimulator>(config);
    }

    const std::vector<std::string>& GameSimulator::questionTopics() {
        static const std::vector<std::string> topics = {
            "Will Project Omega's satellite launch succeed?",
            "Will the scandal force President Stump to resign?",
            "Will TechCorp's AI breakthrough be announced?",
            "Will the climate summit reach an agreement?"
        };
        return topics;
    }

    std::string GameSimulator::generateGameId() {
        return fmt::format("game-{:016x}", rng_.next());
    }

    std::string GameSimulator::generateQuestion() {
        if (!config_.question.empty()) return config_.question;
        const auto& topics = questionTopics();
        return topics[static_cast<size_t>(rng_.uniformInt(0, static_cast<int>(topics.size()) - 1))];
    }

    void GameSimulator::start() {
        if (state_ == GameState::ENDED) {
            throw GameError(ErrorKind::POST_RESOLUTION, "game " + gameId_ + " has already ended");
        }
        if (state_ != GameState::NOT_STARTED) {
            throw GameError(ErrorKind::INVALID_STATE, "game has already been started");
        }

        gameId_ = generateGameId();
        question_ = generateQuestion();
        engine_.initialize();

        state_ = GameState::RUNNING;
        currentDay_ = 0;

        GameStartedPayload started;
        started.gameId = gameId_;
        started.question = question_;
        started.numAgents = static_cast<int>(engine_.getAgents().size());
        started.numInsiders = engine_.getNumInsiders();
        started.duration = config_.duration;
        started.liquidityParameter = config_.liquidityParameter;
        log_.emit(0, started);

        Logger::info("Game {} started: \"{}\"", gameId_, question_);
    }

    bool GameSimulator::stepDay() {
        requireRunning("advance a day");
        if (currentDay_ >= config_.duration) {
            return false;
        }

        currentDay_++;
        engine_.runDay(currentDay_);
        return true;
    }

    GameResult GameSimulator::resolve() {
        requireRunning("resolve");
        if (currentDay_ < config_.duration) {
            throw GameError(ErrorKind::INVALID_STATE,
                "cannot resolve on day " + std::to_string(currentDay_) +
                " of " + std::to_string(config_.duration));
        }

        state_ = GameState::RESOLVING;
        Day day = currentDay_;

        log_.emit(day, OutcomeRevealedPayload{ config_.outcome });

        auto report = Settlement::settle(engine_.getMarket(), engine_.getMutableAgents(),
            config_.outcome, config_.settlement);

        GameEndedPayload ended;
        ended.outcome = config_.outcome;
        ended.winners = report.winners;
        ended.losers = report.losers;
        ended.reputationChanges = report.reputationChanges;
        ended.market = engine_.getMarket();
        const GameEvent& endEvent = log_.emit(day, ended);

        GameResult result;
        result.id = gameId_;
        result.question = question_;
        result.outcome = config_.outcome;
        result.startTime = log_.getEvents().front().timestamp;
        result.endTime = endEvent.timestamp;
        result.events = log_.getEvents();
        for (const auto& agent : engine_.getAgents()) {
            result.agents.push_back(agent->snapshot());
        }
        result.market = engine_.getMarket();
        result.winners = std::move(report.winners);
        result.losers = std::move(report.losers);
        result.reputationChanges = std::move(report.reputationChanges);

        state_ = GameState::ENDED;
        result_ = result;

        Logger::info("Game {} ended: outcome {}, {} events, {}/{} winners, final YES price {:.3f}",
            gameId_, config_.outcome ? "YES" : "NO", result.events.size(),
            result.winners.size(), result.agents.size(), result.market.priceYes);

        return result;
    }

    GameResult GameSimulator::runCompleteGame() {
        start();
        while (stepDay()) {
        }
        return resolve();
    }

    Action GameSimulator::decide(AgentId agentId) {
        requireRunning("decide");
        return engine_.previewFor(requireAgent(agentId), currentDay_);
    }

    TradeResult GameSimulator::placeBet(AgentId agentId, Side side, double amount) {
        requireRunning("trade");
        return engine_.executeBet(requireAgent(agentId), side, amount, currentDay_);
    }

    EventLog::SubscriptionId GameSimulator::on(EventType type, EventLog::Handler handler) {
        return log_.on(type, std::move(handler));
    }

    EventLog::SubscriptionId GameSimulator::onAny(EventLog::Handler handler) {
        return log_.onAny(std::move(handler));
    }

    bool GameSimulator::off(EventLog::SubscriptionId id) {
        return log_.off(id);
    }

    void GameSimulator::addSink(EventSink* sink) {
        log_.addSink(sink);
    }

    void GameSimulator::requireRunning(const char* operation) const {
        if (state_ == GameState::ENDED) {
            throw GameError(ErrorKind::POST_RESOLUTION,
                std::string("cannot ") + operation + ": game " + gameId_ + " has ended");
        }
        if (state_ != GameState::RUNNING) {
            throw GameError(ErrorKind::INVALID_STATE,
                std::string("cannot ") + operation + " while the game is " + toString(state_));
        }
        if (log_.isDispatching()) {
            throw GameError(ErrorKind::INVALID_STATE,
                std::string("cannot ") + operation + " from inside an event handler");
        }
    }

    Agent& GameSimulator::requireAgent(AgentId id) {
        Agent* agent = engine_.getAgent(id);
        if (!agent) {
            throw GameError(ErrorKind::INVALID_STATE, "unknown agent " + std::to_string(id));
        }
        return *agent;
    }

    nlohmann::json GameSimulator::getStateJson() const {
        const auto& market = engine_.getMarket();

        nlohmann::json state;
        state["gameId"] = gameId_;
        state["question"] = question_;
        state["state"] = toString(state_);
        state["day"] = currentDay_;
        state["duration"] = config_.duration;
        state["date"] = clock_.currentDateString();
        state["events"] = log_.size();
        state["bets"] = engine_.getTotalBets();
        state["diagnostics"] = engine_.getDiagnostics();
        state["market"] = {
            {"quantityYes", market.quantityYes},
            {"quantityNo", market.quantityNo},
            {"priceYes", market.priceYes},
            {"priceNo", market.priceNo},
            {"totalVolume", market.totalVolume},
            {"liquidityParameter", market.liquidity}
        };

        nlohmann::json roles = nlohmann::json::object();
        for (const auto& [role, stats] : engine_.getRoleStats()) {
            roles[toString(role)] = {
                {"betsPlaced", stats.betsPlaced},
                {"yesBets", stats.yesBets},
                {"noBets", stats.noBets},
                {"sharesBought", stats.sharesBought},
                {"cashSpent", stats.cashSpent}
            };
        }
        state["roles"] = roles;

        return state;
    }

} // namespace prediction
