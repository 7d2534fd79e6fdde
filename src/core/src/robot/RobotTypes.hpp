/**
 * @file RobotTypes.hpp
 * @brief Connection states, action kinds, stream events and catalog entries
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <functional>
#include <variant>
#include <nlohmann/json.hpp>

namespace nao_bridge {
namespace robot {

/**
 * Session connection state
 */
enum class ConnectionState : uint8_t {
    DISCONNECTED = 0,
    CONNECTING,
    CONNECTED,
    FAILED
};

/**
 * Operations a backend knows how to execute
 */
enum class ActionKind : uint8_t {
    SET_TTS_LANGUAGE = 0,   // {language}
    SAY,                    // {text}
    STOP_SAY,
    WAKE_UP,
    REST,
    GO_TO_POSTURE,          // {posture, speed, maxTries}
    CHANGE_EYES_COLOR,      // {color}
    SET_BASIC_AWARENESS,    // {enabled, engagementMode, trackingMode}
    SET_BREATHING,          // {enabled, chainName}
    START_BEHAVIOR,         // {name} - returns once started
    RUN_BEHAVIOR,           // {name} - returns once finished
    STOP_BEHAVIOR           // {name}
};

/**
 * The three behavior catalogs
 */
enum class CatalogKind : uint8_t {
    DANCES = 0,
    EXPRESSIVE_REACTIONS,
    BODY_ACTIONS
};

/**
 * Stream sources
 */
enum class StreamKind : uint8_t {
    TOUCH = 0,
    JOINTS,
    AUDIO
};

constexpr int STREAM_KIND_COUNT = 3;

inline std::string toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "Disconnected";
        case ConnectionState::CONNECTING:   return "Connecting";
        case ConnectionState::CONNECTED:    return "Connected";
        case ConnectionState::FAILED:       return "Failed";
        default:                            return "Unknown";
    }
}

inline std::string toString(ActionKind kind) {
    switch (kind) {
        case ActionKind::SET_TTS_LANGUAGE:    return "SET_TTS_LANGUAGE";
        case ActionKind::SAY:                 return "SAY";
        case ActionKind::STOP_SAY:            return "STOP_SAY";
        case ActionKind::WAKE_UP:             return "WAKE_UP";
        case ActionKind::REST:                return "REST";
        case ActionKind::GO_TO_POSTURE:       return "GO_TO_POSTURE";
        case ActionKind::CHANGE_EYES_COLOR:   return "CHANGE_EYES_COLOR";
        case ActionKind::SET_BASIC_AWARENESS: return "SET_BASIC_AWARENESS";
        case ActionKind::SET_BREATHING:       return "SET_BREATHING";
        case ActionKind::START_BEHAVIOR:      return "START_BEHAVIOR";
        case ActionKind::RUN_BEHAVIOR:        return "RUN_BEHAVIOR";
        case ActionKind::STOP_BEHAVIOR:       return "STOP_BEHAVIOR";
        default:                              return "UNKNOWN";
    }
}

inline std::string toString(CatalogKind kind) {
    switch (kind) {
        case CatalogKind::DANCES:               return "dances";
        case CatalogKind::EXPRESSIVE_REACTIONS: return "expressive-reactions";
        case CatalogKind::BODY_ACTIONS:         return "body-actions";
        default:                                return "unknown";
    }
}

/// Wire name of a stream kind ("touch", "joints", "audio")
inline std::string toString(StreamKind kind) {
    switch (kind) {
        case StreamKind::TOUCH:  return "touch";
        case StreamKind::JOINTS: return "joints";
        case StreamKind::AUDIO:  return "audio";
        default:                 return "unknown";
    }
}

// ============================================================================
// Stream events
// ============================================================================

struct TouchEvent {
    std::string part;   // FrontTactilTouched, MiddleTactilTouched, RearTactilTouched
    int state = 0;      // 1 = touched, 0 = released
};

struct JointsFrame {
    std::vector<std::string> names;
    std::vector<float> angles;  // radians, same order and length as names

    bool isValid() const { return names.size() == angles.size(); }
};

struct AudioFrame {
    int sampleRate = 16000;
    int channels = 1;
    int samplesPerChannel = 0;
    std::vector<uint8_t> payload;   // opaque, as delivered by the audio device
};

/**
 * One event from any stream source
 */
struct StreamEvent {
    uint64_t sequence = 0;   // per-kind, assigned by the producing backend
    int64_t timestamp = 0;   // ms since epoch
    std::variant<TouchEvent, JointsFrame, AudioFrame> data;

    StreamKind kind() const {
        switch (data.index()) {
            case 0:  return StreamKind::TOUCH;
            case 1:  return StreamKind::JOINTS;
            default: return StreamKind::AUDIO;
        }
    }
};

/// Backend → session event path
using StreamSink = std::function<void(const StreamEvent&)>;

// ============================================================================
// Catalog
// ============================================================================

struct LocalizedName {
    std::string en_US;
    std::string fr_FR;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(LocalizedName, en_US, fr_FR)
};

/**
 * One invocable behavior (dance, body action) or one reaction type.
 * For reaction types, behaviors lists the candidate behavior names.
 */
struct CatalogEntry {
    std::string id;
    std::string behaviorName;
    LocalizedName localizedName;
    std::string description;
    std::vector<std::string> behaviors;
    bool isReactionType = false;

    std::string displayName() const {
        return localizedName.en_US.empty() ? id : localizedName.en_US;
    }
};

/**
 * Wire form: {id, display-name, metadata{behaviorName, localizedName, description[, behaviors]}}
 */
inline void to_json(nlohmann::json& j, const CatalogEntry& entry) {
    nlohmann::json metadata = {
        {"behaviorName", entry.behaviorName},
        {"localizedName", entry.localizedName},
        {"description", entry.description}
    };
    if (entry.isReactionType) {
        metadata["behaviors"] = entry.behaviors;
    }
    j = nlohmann::json{
        {"id", entry.id},
        {"display-name", entry.displayName()},
        {"metadata", metadata}
    };
}

} // namespace robot
} // namespace nao_bridge
