/**
 * @file RobotError.hpp
 * @brief Error taxonomy and the Outcome value returned by backend and session calls
 */

#pragma once

#include <string>
#include <utility>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace nao_bridge {
namespace robot {

/**
 * Error kinds, shared by the session API and the wire protocol
 */
enum class ErrorKind : uint8_t {
    NONE = 0,
    CONNECT_ERROR,          // backend link could not be established
    NOT_CONNECTED,          // operation issued before a successful connect
    BUSY,                   // posture operation already in flight
    UNKNOWN_COMMAND,        // dispatcher: no such command name
    INVALID_PARAMETERS,     // dispatcher: missing or mistyped field
    ACTION_ERROR,           // backend reported failure during invoke
    SUBSCRIBE_ERROR         // stream subscription could not be established
};

/// Wire name of an error kind
inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:               return "None";
        case ErrorKind::CONNECT_ERROR:      return "ConnectError";
        case ErrorKind::NOT_CONNECTED:      return "NotConnected";
        case ErrorKind::BUSY:               return "Busy";
        case ErrorKind::UNKNOWN_COMMAND:    return "UnknownCommand";
        case ErrorKind::INVALID_PARAMETERS: return "InvalidParameters";
        case ErrorKind::ACTION_ERROR:       return "ActionError";
        case ErrorKind::SUBSCRIBE_ERROR:    return "SubscribeError";
        default:                            return "Unknown";
    }
}

struct RobotError {
    ErrorKind kind = ErrorKind::NONE;
    std::string message;
    /// ConnectError only: the link cannot be re-established without a process restart
    bool fatal = false;
};

/**
 * Success value or RobotError. Never thrown.
 */
template <typename T>
class Outcome {
public:
    static Outcome success(T value = T{}) {
        Outcome o;
        o.m_value = std::move(value);
        return o;
    }

    static Outcome failure(ErrorKind kind, std::string message, bool fatal = false) {
        Outcome o;
        o.m_error.kind = kind;
        o.m_error.message = std::move(message);
        o.m_error.fatal = fatal;
        return o;
    }

    static Outcome failure(const RobotError& error) {
        Outcome o;
        o.m_error = error;
        return o;
    }

    bool ok() const { return m_error.kind == ErrorKind::NONE; }
    explicit operator bool() const { return ok(); }

    const T& value() const { return m_value; }
    T& value() { return m_value; }

    const RobotError& error() const { return m_error; }

private:
    Outcome() = default;

    T m_value{};
    RobotError m_error;
};

using ActionOutcome = Outcome<nlohmann::json>;

/// Error body as serialized in a reply envelope
inline nlohmann::json errorToJson(const RobotError& error) {
    nlohmann::json j = {
        {"kind", toString(error.kind)},
        {"message", error.message}
    };
    if (error.kind == ErrorKind::CONNECT_ERROR) {
        j["fatal"] = error.fatal;
    }
    return j;
}

} // namespace robot
} // namespace nao_bridge
