#pragma once

#include <stdexcept>
#include <string>

namespace prediction {

    enum class ErrorKind {
        CONFIGURATION,
        INVALID_TRADE,
        NUMERIC,
        INVALID_STATE,
        POST_RESOLUTION
    };

    inline const char* toString(ErrorKind kind) {
        switch (kind) {
        case ErrorKind::CONFIGURATION: return "configuration";
        case ErrorKind::INVALID_TRADE: return "invalid_trade";
        case ErrorKind::NUMERIC: return "numeric";
        case ErrorKind::INVALID_STATE: return "invalid_state";
        case ErrorKind::POST_RESOLUTION: return "post_resolution";
        }
        return "unknown";
    }

    // The only error a caller of the simulator ever sees
    class GameError : public std::runtime_error {
    public:
        GameError(ErrorKind kind, const std::string& message)
            : std::runtime_error(std::string(toString(kind)) + " error: " + message)
            , kind_(kind)
        {
        }

        ErrorKind kind() const { return kind_; }

    private:
        ErrorKind kind_;
    };

    // Raised inside an agent's decision step; absorbed by the engine
    class AgentDecisionError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

} // namespace prediction
