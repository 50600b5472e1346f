#include "Serialization.hpp"
#include "GameError.hpp"

namespace prediction {

    using json = nlohmann::json;

    namespace {

        [[noreturn]] void unknown(const char* what, const std::string& s) {
            throw GameError(ErrorKind::CONFIGURATION, std::string("unknown ") + what + ": " + s);
        }

    } // namespace

    // ---- Enums ----

    Side sideFromString(const std::string& s) {
        if (s == "YES") return Side::YES;
        if (s == "NO") return Side::NO;
        unknown("side", s);
    }

    AgentRole roleFromString(const std::string& s) {
        if (s == "insider") return AgentRole::INSIDER;
        if (s == "outsider") return AgentRole::OUTSIDER;
        unknown("role", s);
    }

    ClueTier tierFromString(const std::string& s) {
        if (s == "early") return ClueTier::EARLY;
        if (s == "mid") return ClueTier::MID;
        if (s == "late") return ClueTier::LATE;
        unknown("tier", s);
    }

    DistributionPhase phaseFromString(const std::string& s) {
        if (s == "insider") return DistributionPhase::INSIDER;
        if (s == "spread") return DistributionPhase::SPREAD;
        unknown("distribution phase", s);
    }

    Stance stanceFromString(const std::string& s) {
        if (s == "YES") return Stance::YES;
        if (s == "NO") return Stance::NO;
        if (s == "NEUTRAL") return Stance::NEUTRAL;
        unknown("stance", s);
    }

    // ---- Market / agents ----

    void to_json(json& j, const MarketState& m) {
        j = json{
            {"quantityYes", m.quantityYes},
            {"quantityNo", m.quantityNo},
            {"priceYes", m.priceYes},
            {"priceNo", m.priceNo},
            {"totalVolume", m.totalVolume},
            {"liquidityParameter", m.liquidity}
        };
    }

    void from_json(const json& j, MarketState& m) {
        j.at("quantityYes").get_to(m.quantityYes);
        j.at("quantityNo").get_to(m.quantityNo);
        j.at("priceYes").get_to(m.priceYes);
        j.at("priceNo").get_to(m.priceNo);
        j.at("totalVolume").get_to(m.totalVolume);
        j.at("liquidityParameter").get_to(m.liquidity);
    }

    void to_json(json& j, const AgentSnapshot& a) {
        j = json{
            {"id", a.id},
            {"name", a.name},
            {"role", toString(a.role)},
            {"knownClues", a.knownClues},
            {"yesShares", a.yesShares},
            {"noShares", a.noShares},
            {"position", a.position()},
            {"betsPlaced", a.betsPlaced},
            {"balance", a.balance},
            {"totalSpent", a.totalSpent},
            {"reputation", a.reputation},
            {"finalPnL", a.finalPnL}
        };
    }

    // "position" is derived and not read back
    void from_json(const json& j, AgentSnapshot& a) {
        j.at("id").get_to(a.id);
        j.at("name").get_to(a.name);
        a.role = roleFromString(j.at("role").get<std::string>());
        j.at("knownClues").get_to(a.knownClues);
        j.at("yesShares").get_to(a.yesShares);
        j.at("noShares").get_to(a.noShares);
        j.at("betsPlaced").get_to(a.betsPlaced);
        j.at("balance").get_to(a.balance);
        j.at("totalSpent").get_to(a.totalSpent);
        j.at("reputation").get_to(a.reputation);
        j.at("finalPnL").get_to(a.finalPnL);
    }

    void to_json(json& j, const ReputationChange& r) {
        j = json{
            {"agentId", r.agentId},
            {"before", r.before},
            {"after", r.after},
            {"change", r.change},
            {"reason", r.reason}
        };
    }

    void from_json(const json& j, ReputationChange& r) {
        j.at("agentId").get_to(r.agentId);
        j.at("before").get_to(r.before);
        j.at("after").get_to(r.after);
        j.at("change").get_to(r.change);
        j.at("reason").get_to(r.reason);
    }

    void to_json(json& j, const DayDiagnostic& d) {
        j = json{ {"day", d.day}, {"agentId", d.agentId}, {"message", d.message} };
    }

    // ---- Payloads ----

    void to_json(json& j, const GameStartedPayload& p) {
        j = json{
            {"gameId", p.gameId},
            {"question", p.question},
            {"numAgents", p.numAgents},
            {"numInsiders", p.numInsiders},
            {"duration", p.duration},
            {"liquidityParameter", p.liquidityParameter}
        };
    }

    void from_json(const json& j, GameStartedPayload& p) {
        j.at("gameId").get_to(p.gameId);
        j.at("question").get_to(p.question);
        j.at("numAgents").get_to(p.numAgents);
        j.at("numInsiders").get_to(p.numInsiders);
        j.at("duration").get_to(p.duration);
        j.at("liquidityParameter").get_to(p.liquidityParameter);
    }

    void to_json(json& j, const DayChangedPayload& p) {
        j = json{ {"day", p.day} };
    }

    void from_json(const json& j, DayChangedPayload& p) {
        j.at("day").get_to(p.day);
    }

    void to_json(json& j, const ClueDistributedPayload& p) {
        j = json{
            {"clueId", p.clueId},
            {"agentId", p.agentId},
            {"signal", p.signal},
            {"reliability", p.reliability},
            {"tier", toString(p.tier)},
            {"phase", toString(p.phase)}
        };
    }

    void from_json(const json& j, ClueDistributedPayload& p) {
        j.at("clueId").get_to(p.clueId);
        j.at("agentId").get_to(p.agentId);
        j.at("signal").get_to(p.signal);
        j.at("reliability").get_to(p.reliability);
        p.tier = tierFromString(j.at("tier").get<std::string>());
        p.phase = phaseFromString(j.at("phase").get<std::string>());
    }

    void to_json(json& j, const AgentBetPayload& p) {
        j = json{
            {"agentId", p.agentId},
            {"side", toString(p.side)},
            {"amount", p.amount},
            {"shares", p.shares},
            {"cost", p.cost},
            {"priceBefore", p.priceBefore},
            {"priceAfter", p.priceAfter}
        };
    }

    void from_json(const json& j, AgentBetPayload& p) {
        j.at("agentId").get_to(p.agentId);
        p.side = sideFromString(j.at("side").get<std::string>());
        j.at("amount").get_to(p.amount);
        j.at("shares").get_to(p.shares);
        j.at("cost").get_to(p.cost);
        j.at("priceBefore").get_to(p.priceBefore);
        j.at("priceAfter").get_to(p.priceAfter);
    }

    void to_json(json& j, const AgentPostPayload& p) {
        j = json{
            {"agentId", p.agentId},
            {"stance", toString(p.stance)},
            {"betsPlaced", p.betsPlaced},
            {"priceYes", p.priceYes},
            {"priceNo", p.priceNo},
            {"totalVolume", p.totalVolume}
        };
    }

    void from_json(const json& j, AgentPostPayload& p) {
        j.at("agentId").get_to(p.agentId);
        p.stance = stanceFromString(j.at("stance").get<std::string>());
        j.at("betsPlaced").get_to(p.betsPlaced);
        j.at("priceYes").get_to(p.priceYes);
        j.at("priceNo").get_to(p.priceNo);
        j.at("totalVolume").get_to(p.totalVolume);
    }

    void to_json(json& j, const MarketUpdatedPayload& p) {
        j = p.market;
    }

    void from_json(const json& j, MarketUpdatedPayload& p) {
        j.get_to(p.market);
    }

    void to_json(json& j, const OutcomeRevealedPayload& p) {
        j = json{ {"outcome", p.outcome} };
    }

    void from_json(const json& j, OutcomeRevealedPayload& p) {
        j.at("outcome").get_to(p.outcome);
    }

    void to_json(json& j, const GameEndedPayload& p) {
        j = json{
            {"outcome", p.outcome},
            {"winners", p.winners},
            {"losers", p.losers},
            {"reputationChanges", p.reputationChanges},
            {"market", p.market}
        };
    }

    void from_json(const json& j, GameEndedPayload& p) {
        j.at("outcome").get_to(p.outcome);
        j.at("winners").get_to(p.winners);
        j.at("losers").get_to(p.losers);
        j.at("reputationChanges").get_to(p.reputationChanges);
        j.at("market").get_to(p.market);
    }

    // ---- Events ----

    namespace {

        template<typename T>
        EventPayload payloadAs(const json& j) {
            return EventPayload{ j.get<T>() };
        }

        EventPayload payloadFromJson(EventType type, const json& j) {
            switch (type) {
            case EventType::GAME_STARTED: return payloadAs<GameStartedPayload>(j);
            case EventType::DAY_CHANGED: return payloadAs<DayChangedPayload>(j);
            case EventType::CLUE_DISTRIBUTED: return payloadAs<ClueDistributedPayload>(j);
            case EventType::AGENT_BET: return payloadAs<AgentBetPayload>(j);
            case EventType::AGENT_POST: return payloadAs<AgentPostPayload>(j);
            case EventType::MARKET_UPDATED: return payloadAs<MarketUpdatedPayload>(j);
            case EventType::OUTCOME_REVEALED: return payloadAs<OutcomeRevealedPayload>(j);
            case EventType::GAME_ENDED: return payloadAs<GameEndedPayload>(j);
            }
            unknown("event type", std::to_string(static_cast<int>(type)));
        }

    } // namespace

    void to_json(json& j, const GameEvent& e) {
        json payload;
        std::visit([&payload](const auto& p) { payload = p; }, e.payload);

        j = json{
            {"sequence", e.sequence},
            {"type", toString(e.type)},
            {"day", e.day},
            {"timestamp", e.timestamp},
            {"payload", std::move(payload)}
        };
    }

    void from_json(const json& j, GameEvent& e) {
        std::string name = j.at("type").get<std::string>();
        auto type = eventTypeFromString(name);
        if (!type) unknown("event type", name);

        j.at("sequence").get_to(e.sequence);
        e.type = *type;
        j.at("day").get_to(e.day);
        j.at("timestamp").get_to(e.timestamp);
        e.payload = payloadFromJson(*type, j.at("payload"));
    }

    // ---- Result ----

    void to_json(json& j, const GameResult& r) {
        j = json{
            {"id", r.id},
            {"question", r.question},
            {"outcome", r.outcome},
            {"startTime", r.startTime},
            {"endTime", r.endTime},
            {"events", r.events},
            {"agents", r.agents},
            {"market", r.market},
            {"winners", r.winners},
            {"losers", r.losers},
            {"reputationChanges", r.reputationChanges}
        };
    }

    void from_json(const json& j, GameResult& r) {
        j.at("id").get_to(r.id);
        j.at("question").get_to(r.question);
        j.at("outcome").get_to(r.outcome);
        j.at("startTime").get_to(r.startTime);
        j.at("endTime").get_to(r.endTime);
        j.at("events").get_to(r.events);
        j.at("agents").get_to(r.agents);
        j.at("market").get_to(r.market);
        j.at("winners").get_to(r.winners);
        j.at("losers").get_to(r.losers);
        j.at("reputationChanges").get_to(r.reputationChanges);
    }

} // namespace prediction
