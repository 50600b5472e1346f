#pragma once

#include "Types.hpp"
#include "GameError.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>
#include <cmath>

namespace prediction {

    /// Immutable input of one game: the hidden outcome, the population and
    /// market shape, plus every tunable knob of the clue, agent, betting,
    /// social and settlement models.  Every field carries a default so a game
    /// runs out-of-the-box; `validate()` is the single gate that rejects a
    /// configuration before any simulation state is built.

    struct GameConfig {

        // ---- Game shape ----------------------------------------------------------
        bool        outcome = true;               // hidden until resolution
        int         numAgents = 5;
        int         duration = 30;                // days
        double      liquidityParameter = 100.0;   // LMSR b
        double      insiderPercentage = 0.3;
        uint64_t    seed = 42;
        std::string question;                     // empty = pick from topic list
        std::string startDate = "2025-01-01";     // only used to render dates

        // ---- Clue network --------------------------------------------------------
        struct ClueTierParams {
            int          count = 0;
            double       reliabilityMin = 0.0;
            double       reliabilityMax = 0.0;
            ClueAudience audience = ClueAudience::ALL;
        };

        struct ClueParams {
            ClueTierParams early{ 6, 0.65, 0.75, ClueAudience::INSIDER };
            ClueTierParams mid{ 7, 0.75, 0.85, ClueAudience::ALL };
            ClueTierParams late{ 8, 0.90, 0.99, ClueAudience::ALL };
            double insiderReach = 0.5;      // share of insiders in the first wave
            int    spreadDelayDays = 1;     // insider wave -> everyone

            const ClueTierParams& tier(ClueTier t) const {
                switch (t) {
                case ClueTier::EARLY: return early;
                case ClueTier::MID: return mid;
                case ClueTier::LATE: return late;
                }
                return early;
            }
        } clues;

        // ---- Agent population ----------------------------------------------------
        struct AgentParams {
            double endowment = 1000.0;
            int    initialReputation = 50;
            double betProbabilityMin = 0.4;
            double betProbabilityMax = 0.8;
        } agents;

        // ---- Betting behaviour ---------------------------------------------------
        struct BettingParams {
            double minBet = 50.0;
            double maxBet = 150.0;
            int    reconsiderEarly = 5;     // days between reconsiderations, per tier
            int    reconsiderMid = 3;
            int    reconsiderLate = 1;
            bool   reactToNewClues = true;

            int reconsiderEvery(ClueTier t) const {
                switch (t) {
                case ClueTier::EARLY: return reconsiderEarly;
                case ClueTier::MID: return reconsiderMid;
                case ClueTier::LATE: return reconsiderLate;
                }
                return reconsiderEarly;
            }
        } betting;

        // ---- Social checkpoints --------------------------------------------------
        struct SocialParams {
            int postEveryDays = 3;
            int postersPerCheckpoint = 2;
        } social;

        // ---- Settlement ----------------------------------------------------------
        struct SettlementParams {
            int    winnerReputation = 10;
            int    loserReputation = -5;
            double payoutPerShare = 1.0;
        } settlement;

        int numInsiders() const {
            return static_cast<int>(std::floor(numAgents * insiderPercentage));
        }

        // ==== Validation ==========================================================

        void validate() const {
            auto fail = [](const std::string& msg) {
                throw GameError(ErrorKind::CONFIGURATION, msg);
                };

            if (numAgents < 1) fail("numAgents must be >= 1 (got " + std::to_string(numAgents) + ")");
            if (duration < 1) fail("duration must be >= 1 (got " + std::to_string(duration) + ")");
            if (!std::isfinite(liquidityParameter) || liquidityParameter <= 0.0)
                fail("liquidityParameter must be a finite value > 0");
            if (!(insiderPercentage > 0.0 && insiderPercentage < 1.0))
                fail("insiderPercentage must lie strictly between 0 and 1");

            const ClueTierParams* tiers[] = { &clues.early, &clues.mid, &clues.late };
            const char* names[] = { "early", "mid", "late" };
            for (int i = 0; i < 3; ++i) {
                const auto& t = *tiers[i];
                std::string name = names[i];
                if (t.count < 0) fail("clues." + name + ".count must be >= 0");
                if (t.reliabilityMin < 0.0 || t.reliabilityMax > 1.0 || t.reliabilityMin > t.reliabilityMax)
                    fail("clues." + name + " reliability band must satisfy 0 <= min <= max <= 1");
                if (i > 0 && (t.reliabilityMin < tiers[i - 1]->reliabilityMin ||
                    t.reliabilityMax < tiers[i - 1]->reliabilityMax))
                    fail("clues." + name + " reliability band must not be below the previous tier");
            }
            if (!(clues.insiderReach > 0.0 && clues.insiderReach <= 1.0))
                fail("clues.insiderReach must lie in (0, 1]");
            if (clues.spreadDelayDays < 0) fail("clues.spreadDelayDays must be >= 0");

            if (!(agents.endowment > 0.0)) fail("agents.endowment must be > 0");
            if (agents.betProbabilityMin < 0.0 || agents.betProbabilityMax > 1.0 ||
                agents.betProbabilityMin > agents.betProbabilityMax)
                fail("agents bet probability bounds must satisfy 0 <= min <= max <= 1");

            if (!(betting.minBet > 0.0) || betting.maxBet < betting.minBet)
                fail("betting band must satisfy 0 < minBet <= maxBet");
            if (betting.reconsiderEarly < 1 || betting.reconsiderMid < 1 || betting.reconsiderLate < 1)
                fail("betting reconsider intervals must be >= 1");

            if (social.postEveryDays < 1) fail("social.postEveryDays must be >= 1");
            if (social.postersPerCheckpoint < 0) fail("social.postersPerCheckpoint must be >= 0");

            if (!(settlement.payoutPerShare > 0.0)) fail("settlement.payoutPerShare must be > 0");
        }

        // ==== JSON serialisation ==================================================

        nlohmann::json toJson() const {
            nlohmann::json j;

            j["outcome"] = outcome;
            j["numAgents"] = numAgents;
            j["duration"] = duration;
            j["liquidityParameter"] = liquidityParameter;
            j["insiderPercentage"] = insiderPercentage;
            j["seed"] = seed;
            j["question"] = question;
            j["startDate"] = startDate;

            auto tierJson = [](const ClueTierParams& t) {
                return nlohmann::json{
                    {"count",          t.count},
                    {"reliabilityMin", t.reliabilityMin},
                    {"reliabilityMax", t.reliabilityMax},
                    {"audience",       toString(t.audience)}
                };
                };

            j["clues"] = {
                {"early",           tierJson(clues.early)},
                {"mid",             tierJson(clues.mid)},
                {"late",            tierJson(clues.late)},
                {"insiderReach",    clues.insiderReach},
                {"spreadDelayDays", clues.spreadDelayDays}
            };

            j["agents"] = {
                {"endowment",         agents.endowment},
                {"initialReputation", agents.initialReputation},
                {"betProbabilityMin", agents.betProbabilityMin},
                {"betProbabilityMax", agents.betProbabilityMax}
            };

            j["betting"] = {
                {"minBet",          betting.minBet},
                {"maxBet",          betting.maxBet},
                {"reconsiderEarly", betting.reconsiderEarly},
                {"reconsiderMid",   betting.reconsiderMid},
                {"reconsiderLate",  betting.reconsiderLate},
                {"reactToNewClues", betting.reactToNewClues}
            };

            j["social"] = {
                {"postEveryDays",        social.postEveryDays},
                {"postersPerCheckpoint", social.postersPerCheckpoint}
            };

            j["settlement"] = {
                {"winnerReputation", settlement.winnerReputation},
                {"loserReputation",  settlement.loserReputation},
                {"payoutPerShare",   settlement.payoutPerShare}
            };

            return j;
        }

        /// Merge-patch: only the keys present in `j` are updated; everything
        /// else keeps its current/default value.
        void fromJson(const nlohmann::json& j) {
            auto get = [](const nlohmann::json& obj, const char* key, auto& dst) {
                if (obj.contains(key)) dst = obj[key].get<std::remove_reference_t<decltype(dst)>>();
                };

            auto getTier = [&get](const nlohmann::json& obj, const char* key, ClueTierParams& t) {
                if (!obj.contains(key)) return;
                auto& tj = obj[key];
                get(tj, "count", t.count);
                get(tj, "reliabilityMin", t.reliabilityMin);
                get(tj, "reliabilityMax", t.reliabilityMax);
                if (tj.contains("audience")) {
                    std::string a = tj["audience"].get<std::string>();
                    if (a == "insider") t.audience = ClueAudience::INSIDER;
                    else if (a == "all") t.audience = ClueAudience::ALL;
                    else throw GameError(ErrorKind::CONFIGURATION, "unknown clue audience: " + a);
                }
                };

            get(j, "outcome", outcome);
            get(j, "numAgents", numAgents);
            get(j, "duration", duration);
            get(j, "liquidityParameter", liquidityParameter);
            get(j, "insiderPercentage", insiderPercentage);
            get(j, "seed", seed);
            get(j, "question", question);
            get(j, "startDate", startDate);

            if (j.contains("clues")) {
                auto& c = j["clues"];
                getTier(c, "early", clues.early);
                getTier(c, "mid", clues.mid);
                getTier(c, "late", clues.late);
                get(c, "insiderReach", clues.insiderReach);
                get(c, "spreadDelayDays", clues.spreadDelayDays);
            }

            if (j.contains("agents")) {
                auto& a = j["agents"];
                get(a, "endowment", agents.endowment);
                get(a, "initialReputation", agents.initialReputation);
                get(a, "betProbabilityMin", agents.betProbabilityMin);
                get(a, "betProbabilityMax", agents.betProbabilityMax);
            }

            if (j.contains("betting")) {
                auto& b = j["betting"];
                get(b, "minBet", betting.minBet);
                get(b, "maxBet", betting.maxBet);
                get(b, "reconsiderEarly", betting.reconsiderEarly);
                get(b, "reconsiderMid", betting.reconsiderMid);
                get(b, "reconsiderLate", betting.reconsiderLate);
                get(b, "reactToNewClues", betting.reactToNewClues);
            }

            if (j.contains("social")) {
                auto& s = j["social"];
                get(s, "postEveryDays", social.postEveryDays);
                get(s, "postersPerCheckpoint", social.postersPerCheckpoint);
            }

            if (j.contains("settlement")) {
                auto& s = j["settlement"];
                get(s, "winnerReputation", settlement.winnerReputation);
                get(s, "loserReputation", settlement.loserReputation);
                get(s, "payoutPerShare", settlement.payoutPerShare);
            }
        }

        static GameConfig fromJsonObject(const nlohmann::json& j) {
            GameConfig cfg;
            cfg.fromJson(j);
            return cfg;
        }
    };

} // namespace prediction
