/**
 * @file Envelope.hpp
 * @brief Wire frames of the message server and their serialization
 */

#pragma once

#include <string>
#include <chrono>
#include <atomic>
#include <cstdio>
#include <nlohmann/json.hpp>
#include "../robot/RobotError.hpp"

namespace nao_bridge {
namespace server {

using json = nlohmann::json;

namespace Fields {
    constexpr const char* COMMAND_NAME = "command-name";
    constexpr const char* PARAMETERS = "parameters";
    constexpr const char* REQUEST_ID = "request-id";
    constexpr const char* RESULT = "result";
    constexpr const char* ERROR = "error";
    constexpr const char* STREAM_KIND = "stream-kind";
    constexpr const char* EVENT_PAYLOAD = "event-payload";
}

/**
 * Inbound request
 *
 * JSON Format:
 * {
 *   "command-name": "Say",
 *   "parameters": { "text": "hello" },
 *   "request-id": "optional-client-id"
 * }
 */
struct CommandRequest {
    std::string commandName;
    json parameters = json::object();
    std::string requestId;

    /**
     * Parse a raw frame. On failure returns false with the offending field
     * in error; requestId is still filled when it could be read.
     */
    static bool parse(const std::string& raw, CommandRequest& out, std::string& error) {
        json j;
        try {
            j = json::parse(raw);
        } catch (const json::parse_error& e) {
            error = std::string("Malformed JSON: ") + e.what();
            return false;
        }

        if (!j.is_object()) {
            error = "Frame must be a JSON object";
            return false;
        }

        auto id = j.find(Fields::REQUEST_ID);
        if (id != j.end() && !id->is_null()) {
            if (!id->is_string()) {
                error = "Field 'request-id' must be a string";
                return false;
            }
            out.requestId = id->get<std::string>();
        }

        auto name = j.find(Fields::COMMAND_NAME);
        if (name == j.end()) {
            error = "Missing field 'command-name'";
            return false;
        }
        if (!name->is_string()) {
            error = "Field 'command-name' must be a string";
            return false;
        }
        out.commandName = name->get<std::string>();

        auto params = j.find(Fields::PARAMETERS);
        if (params != j.end() && !params->is_null()) {
            if (!params->is_object()) {
                error = "Field 'parameters' must be an object";
                return false;
            }
            out.parameters = *params;
        }
        return true;
    }

    /**
     * Generate a request id for requests that did not carry one
     */
    static std::string generateId() {
        static std::atomic<uint64_t> counter{0};
        auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::high_resolution_clock::now().time_since_epoch()).count();

        char buf[64];
        snprintf(buf, sizeof(buf), "%016llx-%08llx",
                 static_cast<unsigned long long>(nanos),
                 static_cast<unsigned long long>(++counter));
        return std::string(buf);
    }
};

/// {"request-id", "result"}
inline json makeReply(const std::string& requestId, const json& result) {
    return json{
        {Fields::REQUEST_ID, requestId},
        {Fields::RESULT, result}
    };
}

/// {"request-id", "error": {"kind", "message"[, "fatal"]}}
inline json makeErrorReply(const std::string& requestId, const robot::RobotError& error) {
    return json{
        {Fields::REQUEST_ID, requestId},
        {Fields::ERROR, robot::errorToJson(error)}
    };
}

/// {"stream-kind", "event-payload"}
inline json makeEvent(const std::string& streamKind, const json& payload) {
    return json{
        {Fields::STREAM_KIND, streamKind},
        {Fields::EVENT_PAYLOAD, payload}
    };
}

} // namespace server
} // namespace nao_bridge
