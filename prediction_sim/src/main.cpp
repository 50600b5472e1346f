#include "engine/GameSimulator.hpp"
#include "core/GameError.hpp"
#include "core/Serialization.hpp"
#include "utils/Logger.hpp"
#include "utils/Statistics.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <optional>

using namespace prediction;

namespace {

    struct GameSummary {
        std::string id;
        bool outcome = true;
        uint64_t seed = 0;
        size_t events = 0;
        size_t agents = 0;
        size_t winners = 0;
        double finalPriceYes = 0.5;
        double totalVolume = 0.0;
        int insiders = 0;
        int insiderWinners = 0;
        int outsiders = 0;
        int outsiderWinners = 0;
        bool priceLeanedCorrectly = false;
    };

    GameSummary summarize(const GameResult& result, uint64_t seed) {
        GameSummary s;
        s.id = result.id;
        s.outcome = result.outcome;
        s.seed = seed;
        s.events = result.events.size();
        s.agents = result.agents.size();
        s.winners = result.winners.size();
        s.finalPriceYes = result.market.priceYes;
        s.totalVolume = result.market.totalVolume;
        s.priceLeanedCorrectly = result.outcome ? result.market.priceYes > 0.5 : result.market.priceYes < 0.5;

        for (const auto& agent : result.agents) {
            bool won = std::find(result.winners.begin(), result.winners.end(), agent.id) != result.winners.end();
            if (agent.role == AgentRole::INSIDER) {
                s.insiders++;
                if (won) s.insiderWinners++;
            }
            else {
                s.outsiders++;
                if (won) s.outsiderWinners++;
            }
        }
        return s;
    }

    nlohmann::json toJson(const GameSummary& s) {
        return {
            {"id", s.id},
            {"outcome", s.outcome ? "YES" : "NO"},
            {"seed", s.seed},
            {"events", s.events},
            {"agents", s.agents},
            {"winners", s.winners},
            {"finalPriceYes", s.finalPriceYes},
            {"totalVolume", s.totalVolume},
            {"insiderWinners", s.insiderWinners},
            {"insiders", s.insiders},
            {"outsiderWinners", s.outsiderWinners},
            {"outsiders", s.outsiders},
            {"priceLeanedCorrectly", s.priceLeanedCorrectly}
        };
    }

    bool parseOutcome(const std::string& value) {
        if (value == "YES" || value == "yes" || value == "true") return true;
        if (value == "NO" || value == "no" || value == "false") return false;
        throw GameError(ErrorKind::CONFIGURATION, "--outcome must be YES or NO, got " + value);
    }

    GameConfig loadConfigFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw GameError(ErrorKind::CONFIGURATION, "could not open config file: " + path);
        }
        try {
            return GameConfig::fromJsonObject(nlohmann::json::parse(file));
        }
        catch (const nlohmann::json::exception& e) {
            throw GameError(ErrorKind::CONFIGURATION, "invalid config file " + path + ": " + e.what());
        }
    }

    void saveResult(const GameResult& result, const std::string& path) {
        std::ofstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("could not write " + path);
        }
        file << nlohmann::json(result).dump(2) << "\n";
        Logger::info("Saved game result to {}", path);
    }

    void printUsage() {
        std::cout << "Prediction Market Game Simulator\n"
            << "Usage: prediction_sim [options]\n"
            << "Options:\n"
            << "  --outcome YES|NO        Ground-truth outcome (default: YES)\n"
            << "  --agents <n>            Number of agents (default: 5)\n"
            << "  --duration <days>       Game length in days (default: 30)\n"
            << "  --liquidity <b>         LMSR liquidity parameter (default: 100)\n"
            << "  --insiders <fraction>   Share of insiders in [0,1] (default: 0.3)\n"
            << "  --seed <n>              RNG seed (default: 42)\n"
            << "  --config <path>         Load a GameConfig JSON file; flags override it\n"
            << "  --count <n>             Run n games, alternating outcomes, seeds seed+i\n"
            << "  --save <path>           Write the GameResult JSON (single game)\n"
            << "  --json                  Print JSON to stdout only\n"
            << "  --verbose               Stream every event to the log\n"
            << "  --log-level <level>     trace|debug|info|warn|error|off (default: info)\n"
            << "  --help                  Show this help\n";
    }

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath;
    std::string savePath;
    std::string logLevel = "info";
    int count = 1;
    bool jsonOutput = false;
    bool verbose = false;

    // Flag overrides, applied on top of the config file
    std::optional<bool> outcome;
    std::optional<int> numAgents;
    std::optional<int> duration;
    std::optional<double> liquidity;
    std::optional<double> insiders;
    std::optional<uint64_t> seed;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            bool hasValue = i + 1 < argc;
            if (arg == "--outcome" && hasValue) {
                outcome = parseOutcome(argv[++i]);
            }
            else if (arg == "--agents" && hasValue) {
                numAgents = std::stoi(argv[++i]);
            }
            else if (arg == "--duration" && hasValue) {
                duration = std::stoi(argv[++i]);
            }
            else if (arg == "--liquidity" && hasValue) {
                liquidity = std::stod(argv[++i]);
            }
            else if (arg == "--insiders" && hasValue) {
                insiders = std::stod(argv[++i]);
            }
            else if (arg == "--seed" && hasValue) {
                seed = std::stoull(argv[++i]);
            }
            else if (arg == "--config" && hasValue) {
                configPath = argv[++i];
            }
            else if (arg == "--count" && hasValue) {
                count = std::stoi(argv[++i]);
            }
            else if (arg == "--save" && hasValue) {
                savePath = argv[++i];
            }
            else if (arg == "--log-level" && hasValue) {
                logLevel = argv[++i];
            }
            else if (arg == "--json") {
                jsonOutput = true;
            }
            else if (arg == "--verbose") {
                verbose = true;
            }
            else if (arg == "--help") {
                printUsage();
                return 0;
            }
            else {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage();
                return 1;
            }
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Invalid arguments: " << e.what() << "\n";
        return 1;
    }

    try {
        // --json keeps stdout clean for the document
        Logger::init(jsonOutput ? "" : "prediction_sim.log", logLevel, !jsonOutput);

        GameConfig config = configPath.empty() ? GameConfig{} : loadConfigFile(configPath);
        if (outcome) config.outcome = *outcome;
        if (numAgents) config.numAgents = *numAgents;
        if (duration) config.duration = *duration;
        if (liquidity) config.liquidityParameter = *liquidity;
        if (insiders) config.insiderPercentage = *insiders;
        if (seed) config.seed = *seed;

        if (count < 1) {
            throw GameError(ErrorKind::CONFIGURATION, "--count must be >= 1");
        }

        Logger::info("=== Prediction Market Game Simulator ===");
        if (!configPath.empty()) Logger::info("Config: {}", configPath);

        auto started = std::chrono::steady_clock::now();

        if (count == 1) {
            auto game = newGame(config);
            if (verbose) {
                game->onAny([](const GameEvent& event) {
                    Logger::info("#{} day {} {} {}", event.sequence, event.day,
                        toString(event.type), nlohmann::json(event)["payload"].dump());
                });
            }

            GameResult result = game->runCompleteGame();
            auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started);

            if (!savePath.empty()) {
                saveResult(result, savePath);
            }

            if (jsonOutput) {
                std::cout << nlohmann::json(result).dump(2) << std::endl;
            }
            else {
                Logger::info("Question: {}", result.question);
                Logger::info("Outcome: {}", result.outcome ? "YES" : "NO");
                Logger::info("Events: {}", result.events.size());
                Logger::info("Winners: {}/{}", result.winners.size(), result.agents.size());
                Logger::info("Final YES price: {:.4f} (volume {:.2f})",
                    result.market.priceYes, result.market.totalVolume);
                if (!game->getDiagnostics().empty()) {
                    Logger::warn("Decision diagnostics: {}", game->getDiagnostics().size());
                }
                Logger::info("Elapsed: {:.1f} ms", elapsed.count());
            }
            return 0;
        }

        // Batch mode
        std::vector<GameSummary> summaries;
        for (int i = 0; i < count; ++i) {
            GameConfig gameConfig = config;
            gameConfig.outcome = (i % 2 == 0);
            gameConfig.seed = config.seed + static_cast<uint64_t>(i);

            auto game = newGame(gameConfig);
            summaries.push_back(summarize(game->runCompleteGame(), gameConfig.seed));
            Logger::debug("Game {}/{} done: {}", i + 1, count, summaries.back().id);
        }
        auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started);

        if (jsonOutput) {
            nlohmann::json out = nlohmann::json::array();
            for (const auto& s : summaries) out.push_back(toJson(s));
            std::cout << out.dump(2) << std::endl;
            return 0;
        }

        std::vector<double> events, winnerShare, finalPrices;
        double insiderWins = 0, insiderCount = 0, outsiderWins = 0, outsiderCount = 0, leaned = 0;
        for (const auto& s : summaries) {
            events.push_back(static_cast<double>(s.events));
            winnerShare.push_back(Statistics::rate(static_cast<double>(s.winners), static_cast<double>(s.agents)));
            finalPrices.push_back(s.finalPriceYes);
            insiderWins += s.insiderWinners;
            insiderCount += s.insiders;
            outsiderWins += s.outsiderWinners;
            outsiderCount += s.outsiders;
            if (s.priceLeanedCorrectly) leaned++;
        }

        Logger::info("Games: {}", summaries.size());
        Logger::info("Average events: {:.1f} (min {:.0f}, max {:.0f})",
            Statistics::mean(events), Statistics::min(events), Statistics::max(events));
        Logger::info("Average winner share: {:.1f}%", Statistics::mean(winnerShare) * 100.0);
        Logger::info("Insider win rate: {:.1f}%", Statistics::rate(insiderWins, insiderCount) * 100.0);
        Logger::info("Outsider win rate: {:.1f}%", Statistics::rate(outsiderWins, outsiderCount) * 100.0);
        Logger::info("Final price leaned toward the outcome: {:.1f}%",
            Statistics::rate(leaned, static_cast<double>(summaries.size())) * 100.0);
        Logger::info("Final YES price: mean {:.3f}, stddev {:.3f}",
            Statistics::mean(finalPrices), Statistics::stddev(finalPrices));
        Logger::info("Elapsed: {:.1f} ms", elapsed.count());
    }
    catch (const GameError& e) {
        Logger::error("Game error: {}", e.what());
        if (jsonOutput) std::cerr << e.what() << "\n";
        return 1;
    }
    catch (const std::exception& e) {
        Logger::error("Fatal error: {}", e.what());
        if (jsonOutput) std::cerr << e.what() << "\n";
        return 1;
    }

    return 0;
}
