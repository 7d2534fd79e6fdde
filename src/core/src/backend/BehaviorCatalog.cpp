/**
 * @file BehaviorCatalog.cpp
 * @brief Catalog derivation from the robot's package list
 */

#include "BehaviorCatalog.hpp"
#include "../logging/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace nao_bridge {
namespace backend {

using json = nlohmann::json;
using robot::CatalogEntry;
using robot::CatalogKind;
using robot::LocalizedName;

namespace {

std::string replaceAll(std::string text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string stringOr(const json& obj, const char* key, const std::string& fallback) {
    if (obj.is_object()) {
        auto it = obj.find(key);
        if (it != obj.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return fallback;
}

CatalogEntry entryFor(const InstalledBehavior& behavior, const std::string& id) {
    CatalogEntry entry;
    entry.id = id;
    entry.behaviorName = behavior.behaviorName;
    entry.localizedName = behavior.localizedName;
    entry.description = behavior.description;
    return entry;
}

CatalogEntry reactionEntry(const std::string& type, std::vector<std::string> behaviors) {
    CatalogEntry entry;
    entry.id = type;
    entry.localizedName = LocalizedName{type, type};
    entry.description = type + " reaction";
    entry.behaviors = std::move(behaviors);
    entry.isReactionType = true;
    return entry;
}

CatalogEntry fixedEntry(const std::string& id, const std::string& behaviorName,
                        const std::string& nameEn, const std::string& nameFr,
                        const std::string& description) {
    CatalogEntry entry;
    entry.id = id;
    entry.behaviorName = behaviorName;
    entry.localizedName = LocalizedName{nameEn, nameFr};
    entry.description = description;
    return entry;
}

} // namespace

const std::vector<std::string>& reactionTypes() {
    static const std::vector<std::string> types = {
        "Happy", "Proud", "Laugh", "Sad", "HeadTouched"
    };
    return types;
}

// ============================================================================
// packages2 parsing
// ============================================================================

std::vector<InstalledBehavior> parseInstalledBehaviors(const json& packages) {
    std::vector<InstalledBehavior> result;
    if (!packages.is_array()) {
        LOG_WARN("Package list is not an array, no behaviors available");
        return result;
    }

    for (const auto& package : packages) {
        if (!package.is_object() || !package.contains("elems")) continue;
        const auto& elems = package["elems"];
        if (!elems.is_object() ||
            !elems.contains("contents") || !elems.contains("names") ||
            !elems.contains("descriptions") ||
            !elems["contents"].is_object() || !elems["contents"].contains("behaviors") ||
            !elems["contents"]["behaviors"].is_array()) {
            continue;
        }

        const std::string uuid = stringOr(package, "uuid", "");
        if (uuid.empty()) continue;

        for (const auto& item : elems["contents"]["behaviors"]) {
            if (!item.is_object()) continue;

            InstalledBehavior behavior;
            behavior.packageUuid = uuid;
            behavior.path = stringOr(item, "path", ".");

            if (behavior.path == ".") {
                behavior.behaviorName = uuid;
                behavior.localizedName.en_US = stringOr(elems["names"], "en_US", "");
                behavior.localizedName.fr_FR =
                    stringOr(elems["names"], "fr_FR", behavior.localizedName.en_US);
                behavior.description = stringOr(elems["descriptions"], "en_US", "");
            } else {
                behavior.behaviorName = uuid + "/" + behavior.path;
                const json names = item.value("langToName", json::object());
                const json descs = item.value("langToDesc", json::object());
                behavior.localizedName.en_US = stringOr(names, "en_US", "");
                behavior.localizedName.fr_FR = stringOr(names, "fr_FR", behavior.localizedName.en_US);
                behavior.description = stringOr(descs, "en_US", "");
            }

            const json tags = item.value("langToTags", json::object());
            if (tags.is_object() && tags.contains("en_US") && tags["en_US"].is_array()) {
                for (const auto& tag : tags["en_US"]) {
                    if (tag.is_string()) behavior.tags.push_back(tag.get<std::string>());
                }
            }

            result.push_back(std::move(behavior));
        }
    }

    LOG_DEBUG("Parsed {} installed behaviors from {} packages", result.size(), packages.size());
    return result;
}

// ============================================================================
// Catalog derivation
// ============================================================================

std::string bodyActionDisplayName(const std::string& animationName) {
    // Applied in order; "Up" must come after the arm names
    static const std::vector<std::pair<std::string, std::string>> replacements = {
        {"LArm", "left arm"},
        {"RArm", "right arm"},
        {"BothArms", "both arms"},
        {"Up", "Raise "},
        {"Stretch", "Stretch "}
    };

    std::string name = animationName;
    for (const auto& r : replacements) {
        name = replaceAll(name, r.first, r.second);
    }
    return name;
}

std::vector<CatalogEntry> buildCatalog(CatalogKind kind,
                                       const std::vector<InstalledBehavior>& behaviors) {
    std::vector<CatalogEntry> entries;

    switch (kind) {
        case CatalogKind::DANCES:
            for (const auto& b : behaviors) {
                if (b.description.find("dance") != std::string::npos) {
                    entries.push_back(entryFor(b, b.behaviorName));
                }
            }
            break;

        case CatalogKind::EXPRESSIVE_REACTIONS:
            for (const auto& type : reactionTypes()) {
                std::vector<std::string> names;
                for (const auto& b : behaviors) {
                    bool match = false;
                    if (type == "HeadTouched") {
                        match = b.packageUuid == "dialog_touch" && b.path == "animations/head_touched";
                    } else {
                        const std::string tag = lowercase(type);
                        match = b.packageUuid == "animations" &&
                                b.path.rfind("Stand/Emotions", 0) == 0 &&
                                std::find(b.tags.begin(), b.tags.end(), tag) != b.tags.end();
                    }
                    if (match) names.push_back(b.behaviorName);
                }
                entries.push_back(reactionEntry(type, std::move(names)));
            }
            break;

        case CatalogKind::BODY_ACTIONS:
            for (const auto& b : behaviors) {
                if (b.packageUuid != "dialog_move_arms") continue;
                const auto slash = b.path.find_last_of('/');
                const std::string id = slash == std::string::npos ? b.path : b.path.substr(slash + 1);
                const std::string display = bodyActionDisplayName(id);

                CatalogEntry entry;
                entry.id = id;
                entry.behaviorName = b.behaviorName;
                entry.localizedName = LocalizedName{display, ""};
                entry.description = display;

                auto existing = std::find_if(entries.begin(), entries.end(),
                    [&id](const CatalogEntry& e) { return e.id == id; });
                if (existing != entries.end()) {
                    *existing = entry;
                } else {
                    entries.push_back(entry);
                }
            }
            break;
    }

    LOG_DEBUG("Catalog {}: {} entries", robot::toString(kind), entries.size());
    return entries;
}

std::vector<CatalogEntry> simulatedCatalog(CatalogKind kind) {
    switch (kind) {
        case CatalogKind::DANCES:
            return {
                fixedEntry("caravan-palace-se", "caravan-palace-se",
                           "Electro Swing", "Electro Swing",
                           "Nao dances on Electro Swing music."),
                fixedEntry("eagle-dance", "eagle-dance",
                           "Eagle Dance", "La danse de l'aigle",
                           "This is a slow dance with impressive moves balanced on one foot."),
                fixedEntry("gangnam-style", "gangnam-style",
                           "Gangnam Style", "Gangnam style",
                           "Gangnam style dance."),
                fixedEntry("thriller-dance", "thriller-dance",
                           "The thriller dance", "La danse thriller",
                           "Nao dances on Michael Jackson's thriller.")
            };

        case CatalogKind::EXPRESSIVE_REACTIONS: {
            std::vector<CatalogEntry> entries;
            for (const auto& type : reactionTypes()) {
                entries.push_back(reactionEntry(type, {"simulated/reactions/" + lowercase(type)}));
            }
            return entries;
        }

        case CatalogKind::BODY_ACTIONS:
            return {
                fixedEntry("StretchBothArms", "dialog_move_arms/animations/StretchBothArms",
                           "Stretch both arms", "Etire les deux bras", "Stretch both arms"),
                fixedEntry("StretchLArm", "dialog_move_arms/animations/StretchLArm",
                           "Stretch left arm", "Etire le bras gauche", "Stretch left arm"),
                fixedEntry("StretchRArm", "dialog_move_arms/animations/StretchRArm",
                           "Stretch right arm", "Etire le bras droit", "Stretch right arm"),
                fixedEntry("UpBothArms", "dialog_move_arms/animations/UpBothArms",
                           "Raise both arms", "Lève les deux bras", "Raise both arms"),
                fixedEntry("UpLArm", "dialog_move_arms/animations/UpLArm",
                           "Raise left arm", "Lève le bras gauche", "Raise left arm"),
                fixedEntry("UpRArm", "dialog_move_arms/animations/UpRArm",
                           "Raise right arm", "Lève le bras droit", "Raise right arm")
            };
    }
    return {};
}

} // namespace backend
} // namespace nao_bridge
