/**
 * @file IRobotBackend.hpp
 * @brief Abstract interface for robot backends (live robot link or simulation)
 *
 * RobotSession only talks to this interface, so a session behaves the same
 * whether a physical robot is reachable or not.
 */

#pragma once

#include <string>
#include <vector>
#include <functional>
#include <nlohmann/json.hpp>
#include "../robot/RobotTypes.hpp"
#include "../robot/RobotError.hpp"

namespace nao_bridge {
namespace backend {

using json = nlohmann::json;

using ConnectOutcome = robot::Outcome<json>;
using CatalogOutcome = robot::Outcome<std::vector<robot::CatalogEntry>>;
using SubscribeOutcome = robot::Outcome<bool>;

/// Fired at most once per connection when the backend loses its link
using LinkLostCallback = std::function<void(const std::string& reason)>;

/**
 * Abstract interface for robot backends.
 *
 * All calls return values; no exception crosses this interface.
 * invoke() and fetchCatalog() may block (postures, behaviors, remote calls)
 * and are never called from an I/O thread.
 */
class IRobotBackend {
public:
    virtual ~IRobotBackend() = default;

    // Connection
    virtual ConnectOutcome connect() = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Actions
    virtual robot::ActionOutcome invoke(robot::ActionKind kind, const json& params) = 0;

    // Catalogs
    virtual CatalogOutcome fetchCatalog(robot::CatalogKind kind) = 0;

    // Streams (one sink per kind; subscribing again replaces the sink)
    virtual SubscribeOutcome subscribe(robot::StreamKind kind, robot::StreamSink sink) = 0;
    virtual void unsubscribe(robot::StreamKind kind) = 0;

    virtual void setLinkLostCallback(LinkLostCallback cb) = 0;

    // Backend info
    virtual std::string getBackendName() const = 0;
    virtual bool isSimulation() const = 0;
    virtual std::string getEndpoint() const { return ""; }
};

} // namespace backend
} // namespace nao_bridge
