#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "engine/GameSimulator.hpp"
#include "engine/GameEngine.hpp"
#include "core/GameError.hpp"
#include "core/Serialization.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <stdexcept>
#include <type_traits>

using namespace prediction;
using Catch::Approx;

namespace {

    GameConfig scenarioConfig() {
        GameConfig config;
        config.outcome = true;
        config.numAgents = 10;
        config.duration = 30;
        config.liquidityParameter = 150.0;
        config.insiderPercentage = 0.25;
        config.seed = 2024;
        return config;
    }

    template<typename F>
    ErrorKind errorKindOf(F&& f) {
        try {
            f();
        }
        catch (const GameError& e) {
            return e.kind();
        }
        throw std::logic_error("expected a GameError");
    }

    bool isWinner(const GameResult& r, AgentId id) {
        return std::find(r.winners.begin(), r.winners.end(), id) != r.winners.end();
    }

    bool isLoser(const GameResult& r, AgentId id) {
        return std::find(r.losers.begin(), r.losers.end(), id) != r.losers.end();
    }

    // One complete run of the reference scenario shared by the read-only tests
    struct ScenarioFixture {
        GameConfig config = scenarioConfig();
        std::unique_ptr<GameSimulator> game = newGame(config);
        GameResult result = game->runCompleteGame();
    };

}

// ============================================================
// End-to-end scenario
// ============================================================

TEST_CASE_METHOD(ScenarioFixture, "GameSimulator: Scenario lifecycle events", "[simulator]") {
    const auto& events = result.events;
    auto count = [&events](EventType t) {
        return std::count_if(events.begin(), events.end(), [t](const GameEvent& e) { return e.type == t; });
    };

    REQUIRE(count(EventType::GAME_STARTED) == 1);
    REQUIRE(count(EventType::DAY_CHANGED) == 30);
    REQUIRE(count(EventType::OUTCOME_REVEALED) == 1);
    REQUIRE(count(EventType::GAME_ENDED) == 1);

    REQUIRE(events.front().type == EventType::GAME_STARTED);
    REQUIRE(events.back().type == EventType::GAME_ENDED);
    REQUIRE(events[events.size() - 2].type == EventType::OUTCOME_REVEALED);
    REQUIRE(events[events.size() - 2].as<OutcomeRevealedPayload>().outcome);

    Day expectedDay = 1;
    for (const auto& e : events) {
        if (e.type != EventType::DAY_CHANGED) continue;
        REQUIRE(e.as<DayChangedPayload>().day == expectedDay);
        REQUIRE(e.day == expectedDay);
        expectedDay++;
    }

    REQUIRE(result.winners.size() > 0);
    REQUIRE(result.winners.size() <= 10);
    REQUIRE(result.agents.size() == 10);
    REQUIRE(game->getState() == GameState::ENDED);
}

TEST_CASE_METHOD(ScenarioFixture, "GameSimulator: Event log is strictly ordered", "[simulator]") {
    const auto& events = result.events;
    for (size_t i = 0; i < events.size(); ++i) {
        REQUIRE(events[i].sequence == i);
        REQUIRE(events[i].type == typeOf(events[i].payload));
        if (i > 0) {
            REQUIRE(events[i].timestamp > events[i - 1].timestamp);
            REQUIRE(events[i].day >= events[i - 1].day);
        }
    }
    REQUIRE(result.startTime == events.front().timestamp);
    REQUIRE(result.endTime == events.back().timestamp);
}

TEST_CASE_METHOD(ScenarioFixture, "GameSimulator: Every bet is followed by its market update", "[simulator]") {
    const auto& events = result.events;
    double lastVolume = 0.0;
    size_t bets = 0;

    for (size_t i = 0; i < events.size(); ++i) {
        if (events[i].type == EventType::AGENT_BET) {
            bets++;
            REQUIRE(i + 1 < events.size());
            REQUIRE(events[i + 1].type == EventType::MARKET_UPDATED);

            const auto& bet = events[i].as<AgentBetPayload>();
            const auto& market = events[i + 1].as<MarketUpdatedPayload>().market;
            REQUIRE(bet.cost > 0.0);
            REQUIRE(bet.shares > 0.0);
            REQUIRE(bet.priceAfter >= bet.priceBefore);
            REQUIRE(market.price(bet.side) == bet.priceAfter);
        }
        if (events[i].type == EventType::MARKET_UPDATED) {
            REQUIRE(i > 0);
            REQUIRE(events[i - 1].type == EventType::AGENT_BET);

            const auto& market = events[i].as<MarketUpdatedPayload>().market;
            REQUIRE(market.priceYes > 0.0);
            REQUIRE(market.priceYes < 1.0);
            REQUIRE(std::fabs(market.priceYes + market.priceNo - 1.0) < 1e-9);
            REQUIRE(market.totalVolume > lastVolume);
            lastVolume = market.totalVolume;
        }
    }

    REQUIRE(bets > 0);
    REQUIRE(result.market.totalVolume == Approx(lastVolume));
}

TEST_CASE_METHOD(ScenarioFixture, "GameSimulator: Insiders never learn a clue after outsiders", "[simulator]") {
    // clueId -> earliest day any insider received it
    std::map<ClueId, Day> firstInsiderDay;
    std::set<AgentId> insiders;
    for (const auto& a : result.agents) {
        if (a.role == AgentRole::INSIDER) insiders.insert(a.id);
    }
    REQUIRE(insiders.size() == 2);

    for (const auto& e : result.events) {
        if (e.type != EventType::CLUE_DISTRIBUTED) continue;
        const auto& p = e.as<ClueDistributedPayload>();

        if (insiders.count(p.agentId)) {
            firstInsiderDay.emplace(p.clueId, e.day);
        }
        else {
            REQUIRE(p.tier != ClueTier::EARLY);
            REQUIRE(p.phase == DistributionPhase::SPREAD);
            REQUIRE(firstInsiderDay.count(p.clueId) == 1);
            REQUIRE(firstInsiderDay[p.clueId] <= e.day);
        }
    }
}

TEST_CASE_METHOD(ScenarioFixture, "GameSimulator: Checkpoints every third day", "[simulator]") {
    std::map<Day, int> postsPerDay;
    for (const auto& e : result.events) {
        if (e.type == EventType::AGENT_POST) postsPerDay[e.day]++;
    }

    REQUIRE(postsPerDay.size() == 10);
    for (const auto& [day, posts] : postsPerDay) {
        REQUIRE(day % 3 == 0);
        REQUIRE(posts == config.social.postersPerCheckpoint);
    }
}

TEST_CASE_METHOD(ScenarioFixture, "GameSimulator: Settlement closure", "[simulator]") {
    double totalPnL = 0.0;
    for (const auto& a : result.agents) {
        bool won = isWinner(result, a.id);
        bool lost = isLoser(result, a.id);
        REQUIRE_FALSE((won && lost));

        double net = a.position();
        if (won) {
            REQUIRE(net > 0.0);
            REQUIRE(a.reputation == 60);
        }
        else if (lost) {
            REQUIRE(net < 0.0);
            REQUIRE(a.reputation == 45);
        }
        else {
            REQUIRE(a.reputation == 50);
        }

        REQUIRE(a.finalPnL == Approx(a.yesShares - a.totalSpent));
        totalPnL += a.finalPnL;
    }
    REQUIRE(std::isfinite(totalPnL));
    REQUIRE(result.reputationChanges.size() == result.agents.size());

    const auto& ended = result.events.back().as<GameEndedPayload>();
    REQUIRE(ended.winners == result.winners);
    REQUIRE(ended.losers == result.losers);
    REQUIRE(ended.outcome == true);
}

TEST_CASE_METHOD(ScenarioFixture, "GameSimulator: Start event hides the outcome", "[simulator]") {
    const auto& started = result.events.front().as<GameStartedPayload>();
    REQUIRE(started.gameId == result.id);
    REQUIRE(started.gameId.rfind("game-", 0) == 0);
    REQUIRE(started.gameId.size() == 21);
    REQUIRE(started.numAgents == 10);
    REQUIRE(started.numInsiders == 2);
    REQUIRE(started.duration == 30);
    REQUIRE(started.liquidityParameter == 150.0);
    REQUIRE_FALSE(started.question.empty());

    nlohmann::json j = result.events.front();
    REQUIRE_FALSE(j["payload"].contains("outcome"));
}

TEST_CASE_METHOD(ScenarioFixture, "GameSimulator: Ended games reject further use", "[simulator]") {
    REQUIRE(errorKindOf([this] { game->decide(1); }) == ErrorKind::POST_RESOLUTION);
    REQUIRE(errorKindOf([this] { game->placeBet(1, Side::YES, 50.0); }) == ErrorKind::POST_RESOLUTION);
    REQUIRE(errorKindOf([this] { game->stepDay(); }) == ErrorKind::POST_RESOLUTION);
    REQUIRE(errorKindOf([this] { game->resolve(); }) == ErrorKind::POST_RESOLUTION);
    REQUIRE(errorKindOf([this] { game->runCompleteGame(); }) == ErrorKind::POST_RESOLUTION);
    REQUIRE(errorKindOf([this] { game->start(); }) == ErrorKind::POST_RESOLUTION);

    REQUIRE(game->getEvents().size() == result.events.size());
    REQUIRE(game->getResult().has_value());
}

TEST_CASE_METHOD(ScenarioFixture, "GameSimulator: State JSON reflects the end of the game", "[simulator]") {
    auto state = game->getStateJson();
    REQUIRE(state["state"] == "ended");
    REQUIRE(state["day"] == 30);
    REQUIRE(state["events"] == result.events.size());
    REQUIRE(state["gameId"] == result.id);
    REQUIRE(state["market"]["priceYes"].get<double>() == result.market.priceYes);
    REQUIRE(state["diagnostics"].is_array());
    REQUIRE(state["diagnostics"].size() == game->getDiagnostics().size());
}

// ============================================================
// Determinism
// ============================================================

TEST_CASE("GameSimulator: Same seed gives identical results", "[simulator]") {
    GameConfig config = scenarioConfig();
    GameResult first = newGame(config)->runCompleteGame();
    GameResult second = newGame(config)->runCompleteGame();

    REQUIRE(first.events.size() == second.events.size());
    REQUIRE(first.id == second.id);
    REQUIRE(nlohmann::json(first).dump() == nlohmann::json(second).dump());
}

TEST_CASE("GameSimulator: Different seeds give different games", "[simulator]") {
    GameConfig config = scenarioConfig();
    GameResult first = newGame(config)->runCompleteGame();
    config.seed += 1;
    GameResult second = newGame(config)->runCompleteGame();

    REQUIRE(first.id != second.id);
}

TEST_CASE("GameSimulator: Observers do not change the run", "[simulator]") {
    GameConfig config = scenarioConfig();
    GameResult clean = newGame(config)->runCompleteGame();

    auto observed = newGame(config);
    size_t seen = 0;
    observed->onAny([&seen](const GameEvent&) { seen++; });
    observed->on(EventType::AGENT_BET, [](const GameEvent&) { throw std::runtime_error("observer bug"); });
    GameResult result = observed->runCompleteGame();

    REQUIRE(seen == result.events.size());
    REQUIRE(nlohmann::json(result.events).dump() == nlohmann::json(clean.events).dump());
}

// ============================================================
// Lifecycle
// ============================================================

TEST_CASE("GameSimulator: Invalid configuration fails at construction", "[simulator]") {
    auto withConfig = [](auto mutate) {
        GameConfig config = scenarioConfig();
        mutate(config);
        return errorKindOf([&config] { newGame(config); });
    };

    REQUIRE(withConfig([](GameConfig& c) { c.numAgents = 0; }) == ErrorKind::CONFIGURATION);
    REQUIRE(withConfig([](GameConfig& c) { c.duration = 0; }) == ErrorKind::CONFIGURATION);
    REQUIRE(withConfig([](GameConfig& c) { c.liquidityParameter = 0.0; }) == ErrorKind::CONFIGURATION);
    REQUIRE(withConfig([](GameConfig& c) { c.liquidityParameter = -10.0; }) == ErrorKind::CONFIGURATION);
    REQUIRE(withConfig([](GameConfig& c) { c.insiderPercentage = 0.0; }) == ErrorKind::CONFIGURATION);
    REQUIRE(withConfig([](GameConfig& c) { c.insiderPercentage = 1.0; }) == ErrorKind::CONFIGURATION);
}

TEST_CASE("GameSimulator: Step mode runs day by day", "[simulator]") {
    auto game = newGame(scenarioConfig());
    REQUIRE(game->getState() == GameState::NOT_STARTED);
    REQUIRE(errorKindOf([&game] { game->stepDay(); }) == ErrorKind::INVALID_STATE);

    game->start();
    REQUIRE(game->getState() == GameState::RUNNING);
    REQUIRE(errorKindOf([&game] { game->start(); }) == ErrorKind::INVALID_STATE);
    REQUIRE(errorKindOf([&game] { game->runCompleteGame(); }) == ErrorKind::INVALID_STATE);

    for (Day d = 1; d <= 30; ++d) {
        REQUIRE(game->stepDay());
        REQUIRE(game->getCurrentDay() == d);
        if (d < 30) {
            REQUIRE(errorKindOf([&game] { game->resolve(); }) == ErrorKind::INVALID_STATE);
        }
    }
    REQUIRE_FALSE(game->stepDay());
    REQUIRE(game->getCurrentDay() == 30);

    GameResult result = game->resolve();
    REQUIRE(game->getState() == GameState::ENDED);
    REQUIRE(nlohmann::json(result).dump() == nlohmann::json(newGame(scenarioConfig())->runCompleteGame()).dump());
}

TEST_CASE("GameSimulator: Previewing decisions does not change the run", "[simulator]") {
    GameConfig config = scenarioConfig();
    auto game = newGame(config);
    game->start();

    size_t previewedBets = 0;
    while (game->stepDay()) {
        size_t eventsBefore = game->getEvents().size();
        for (AgentId id = 1; id <= static_cast<AgentId>(config.numAgents); ++id) {
            if (game->decide(id).isBet()) previewedBets++;
        }
        REQUIRE(game->getEvents().size() == eventsBefore);
    }
    GameResult previewed = game->resolve();

    auto clean = newGame(config);
    GameResult plain = clean->runCompleteGame();

    REQUIRE(previewedBets > 0);
    REQUIRE(game->getDiagnostics().size() == clean->getDiagnostics().size());
    REQUIRE(nlohmann::json(previewed).dump() == nlohmann::json(plain).dump());
}

TEST_CASE("GameSimulator: Engine objects cannot be copied or moved", "[simulator]") {
    STATIC_REQUIRE_FALSE(std::is_copy_constructible_v<GameSimulator>);
    STATIC_REQUIRE_FALSE(std::is_move_constructible_v<GameSimulator>);
    STATIC_REQUIRE_FALSE(std::is_copy_assignable_v<GameSimulator>);
    STATIC_REQUIRE_FALSE(std::is_move_assignable_v<GameSimulator>);
    STATIC_REQUIRE_FALSE(std::is_move_constructible_v<GameEngine>);
    STATIC_REQUIRE_FALSE(std::is_move_constructible_v<EventLog>);
}

TEST_CASE("GameSimulator: Caller-injected bet goes through the market", "[simulator]") {
    auto game = newGame(scenarioConfig());
    game->start();
    game->stepDay();

    double priceBefore = game->getMarket().priceYes;
    size_t eventsBefore = game->getEvents().size();

    TradeResult fill = game->placeBet(5, Side::YES, 100.0);
    REQUIRE(fill.cost == Approx(100.0));
    REQUIRE(game->getMarket().priceYes > priceBefore);

    const auto& events = game->getEvents();
    REQUIRE(events.size() == eventsBefore + 2);
    REQUIRE(events[eventsBefore].type == EventType::AGENT_BET);
    REQUIRE(events[eventsBefore].as<AgentBetPayload>().agentId == 5);
    REQUIRE(events[eventsBefore + 1].type == EventType::MARKET_UPDATED);

    REQUIRE(errorKindOf([&game] { game->placeBet(5, Side::NO, 0.0); }) == ErrorKind::INVALID_TRADE);
    REQUIRE(errorKindOf([&game] { game->placeBet(5, Side::NO, 1e9); }) == ErrorKind::INVALID_TRADE);
    REQUIRE(errorKindOf([&game] { game->placeBet(77, Side::NO, 10.0); }) == ErrorKind::INVALID_STATE);
    REQUIRE(game->getEvents().size() == eventsBefore + 2);
}

TEST_CASE("GameSimulator: Handlers cannot trade", "[simulator]") {
    auto game = newGame(scenarioConfig());
    ErrorKind rejected = ErrorKind::CONFIGURATION;
    bool attempted = false;

    game->on(EventType::DAY_CHANGED, [&](const GameEvent&) {
        if (attempted) return;
        attempted = true;
        try {
            game->placeBet(1, Side::YES, 50.0);
        }
        catch (const GameError& e) {
            rejected = e.kind();
        }
    });
    game->runCompleteGame();

    REQUIRE(attempted);
    REQUIRE(rejected == ErrorKind::INVALID_STATE);
}

TEST_CASE("GameSimulator: One-day game resolves", "[simulator]") {
    GameConfig config = scenarioConfig();
    config.duration = 1;
    GameResult result = newGame(config)->runCompleteGame();

    REQUIRE(std::count_if(result.events.begin(), result.events.end(),
        [](const GameEvent& e) { return e.type == EventType::DAY_CHANGED; }) == 1);
    REQUIRE(result.events.back().type == EventType::GAME_ENDED);
}

// ============================================================
// Agent-level failures
// ============================================================

TEST_CASE("GameEngine: Corrupted knowledge downgrades to Hold", "[simulator]") {
    GameConfig config = scenarioConfig();
    Random rng(config.seed);
    SimClock clock;
    clock.initialize(config.startDate);
    EventLog log(clock);
    GameEngine engine(config, rng, log, clock);
    engine.initialize();

    Agent* agent = engine.getAgent(3);
    REQUIRE(agent != nullptr);
    agent->receiveClue(999, 1);

    Action action = engine.decideFor(*agent, 1);
    REQUIRE_FALSE(action.isBet());
    REQUIRE(engine.getDiagnostics().size() == 1);
    REQUIRE(engine.getDiagnostics()[0].agentId == 3);
    REQUIRE(engine.getDiagnostics()[0].day == 1);

    // The day still completes for everyone else
    REQUIRE_NOTHROW(engine.runDay(1));
    REQUIRE(engine.getDiagnostics().size() == 2);
    REQUIRE(log.count(EventType::DAY_CHANGED) == 1);

    nlohmann::json diag = engine.getDiagnostics()[0];
    REQUIRE(diag["agentId"] == 3);
    REQUIRE(diag["day"] == 1);
    REQUIRE(diag["message"].get<std::string>().find("999") != std::string::npos);
}
