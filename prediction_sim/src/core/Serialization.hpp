#pragma once

#include "Types.hpp"
#include "Events.hpp"
#include <string>
#include <nlohmann/json.hpp>

// JSON form of the game records. Field names follow the event payload
// names; enums are written with their toString() spelling.
namespace prediction {

    // String -> enum. Unknown names throw GameError(CONFIGURATION).
    Side sideFromString(const std::string& s);
    AgentRole roleFromString(const std::string& s);
    ClueTier tierFromString(const std::string& s);
    DistributionPhase phaseFromString(const std::string& s);
    Stance stanceFromString(const std::string& s);

    void to_json(nlohmann::json& j, const MarketState& m);
    void from_json(const nlohmann::json& j, MarketState& m);

    void to_json(nlohmann::json& j, const AgentSnapshot& a);
    void from_json(const nlohmann::json& j, AgentSnapshot& a);

    void to_json(nlohmann::json& j, const ReputationChange& r);
    void from_json(const nlohmann::json& j, ReputationChange& r);

    void to_json(nlohmann::json& j, const DayDiagnostic& d);

    void to_json(nlohmann::json& j, const GameStartedPayload& p);
    void from_json(const nlohmann::json& j, GameStartedPayload& p);
    void to_json(nlohmann::json& j, const DayChangedPayload& p);
    void from_json(const nlohmann::json& j, DayChangedPayload& p);
    void to_json(nlohmann::json& j, const ClueDistributedPayload& p);
    void from_json(const nlohmann::json& j, ClueDistributedPayload& p);
    void to_json(nlohmann::json& j, const AgentBetPayload& p);
    void from_json(const nlohmann::json& j, AgentBetPayload& p);
    void to_json(nlohmann::json& j, const AgentPostPayload& p);
    void from_json(const nlohmann::json& j, AgentPostPayload& p);
    void to_json(nlohmann::json& j, const MarketUpdatedPayload& p);
    void from_json(const nlohmann::json& j, MarketUpdatedPayload& p);
    void to_json(nlohmann::json& j, const OutcomeRevealedPayload& p);
    void from_json(const nlohmann::json& j, OutcomeRevealedPayload& p);
    void to_json(nlohmann::json& j, const GameEndedPayload& p);
    void from_json(const nlohmann::json& j, GameEndedPayload& p);

    // {"sequence", "type", "day", "timestamp", "payload"}
    void to_json(nlohmann::json& j, const GameEvent& e);
    void from_json(const nlohmann::json& j, GameEvent& e);

    void to_json(nlohmann::json& j, const GameResult& r);
    void from_json(const nlohmann::json& j, GameResult& r);

} // namespace prediction
