/**
 * @file BehaviorCatalog.hpp
 * @brief Builds the dance / reaction / body-action catalogs
 *
 * Live robots describe their installed behaviors through
 * PackageManager.packages2; the simulated robot ships a fixed set.
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../robot/RobotTypes.hpp"

namespace nao_bridge {
namespace backend {

/// Reaction types exposed by every backend, in catalog order
const std::vector<std::string>& reactionTypes();

/**
 * One behavior found in the robot's package list
 */
struct InstalledBehavior {
    std::string packageUuid;
    std::string path;           // "." for the package's main behavior
    std::string behaviorName;   // uuid or uuid/path
    robot::LocalizedName localizedName;
    std::string description;
    std::vector<std::string> tags;
};

/**
 * Flatten a packages2 document into installed behaviors.
 * Packages missing names, descriptions or behavior contents are skipped.
 */
std::vector<InstalledBehavior> parseInstalledBehaviors(const nlohmann::json& packages);

/**
 * Derive one catalog from the installed behaviors
 */
std::vector<robot::CatalogEntry> buildCatalog(robot::CatalogKind kind,
                                              const std::vector<InstalledBehavior>& behaviors);

/**
 * Display name of a dialog_move_arms animation ("UpLArm" -> "Raise left arm")
 */
std::string bodyActionDisplayName(const std::string& animationName);

/**
 * Fixed catalogs served by the simulated robot
 */
std::vector<robot::CatalogEntry> simulatedCatalog(robot::CatalogKind kind);

} // namespace backend
} // namespace nao_bridge
