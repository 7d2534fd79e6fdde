#pragma once

/**
 * @file LinkMessages.hpp
 * @brief Messages exchanged with the robot-side agent
 *
 * RPC channel (DEALER <-> ROUTER): one JSON frame per request / reply.
 * Event channel (PUB -> SUB): two frames, [topic, msgpack body].
 */

#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <msgpack.hpp>
#include <nlohmann/json.hpp>

namespace nao_bridge::backend::protocol {

using json = nlohmann::json;

// ============================================================================
// RPC channel (JSON)
// ============================================================================

struct RpcRequest {
    uint64_t id{0};
    std::string service;   // e.g. "ALTextToSpeech"
    std::string method;    // e.g. "setLanguage"
    json args = json::array();

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(RpcRequest, id, service, method, args)
};

struct RpcReply {
    uint64_t id{0};
    bool ok{false};
    json result;
    std::string error;
    bool fatal{false};     // agent could not initialise its robot session

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(RpcReply, id, ok, result, error, fatal)
};

// ============================================================================
// Event channel (msgpack)
// ============================================================================

namespace Topics {
    constexpr const char* TOUCH = "touch";
    constexpr const char* AUDIO = "audio";
}

struct TouchMessage {
    std::string part;      // FrontTactilTouched, MiddleTactilTouched, RearTactilTouched
    int32_t state{0};      // 1 touched, 0 released

    MSGPACK_DEFINE(part, state)
};

struct AudioMessage {
    int32_t sampleRate{16000};
    int32_t channels{1};
    int32_t samplesPerChannel{0};
    std::vector<unsigned char> buffer;   // packed as msgpack bin

    MSGPACK_DEFINE(sampleRate, channels, samplesPerChannel, buffer)
};

template <typename T>
std::string packMessage(const T& message) {
    msgpack::sbuffer buffer;
    msgpack::pack(buffer, message);
    return std::string(buffer.data(), buffer.size());
}

/**
 * Decode a msgpack body; nullopt if the body does not match T
 */
template <typename T>
std::optional<T> unpackMessage(const void* data, size_t size) {
    try {
        msgpack::object_handle handle = msgpack::unpack(static_cast<const char*>(data), size);
        T message;
        handle.get().convert(message);
        return message;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace nao_bridge::backend::protocol
