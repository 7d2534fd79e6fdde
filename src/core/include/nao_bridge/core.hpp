#pragma once
/**
 * @file core.hpp
 * @brief Main include file for NAO Bridge Core
 */

#include "../../src/logging/Logger.hpp"
#include "../../src/config/ConfigManager.hpp"
#include "../../src/robot/RobotSession.hpp"
#include "../../src/backend/SimulatedBackend.hpp"
#include "../../src/backend/LiveBackend.hpp"
#include "../../src/server/CommandDispatcher.hpp"
#include "../../src/server/ConnectionServer.hpp"
