#pragma once

#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "conduit/routing/component.hpp"
#include "conduit/routing/exchange.hpp"
#include "conduit/routing/route_definition.hpp"

namespace conduit::routing {

class Route;

/// @brief Identifies a route created by a RoutingEngine
struct RouteHandle {
    std::string route_id;
    std::string endpoint_uri;

    explicit operator bool() const { return !route_id.empty(); }
};

/// @brief The routing middleware as seen by the bridge
class RoutingEngine {
public:
    virtual ~RoutingEngine() = default;

    /// @brief Builds and starts a route; throws RouteCreationError
    virtual RouteHandle create_route(RouteDefinition definition) = 0;

    /// @brief Stops a route; unknown handles are ignored
    virtual void remove_route(const RouteHandle& handle) = 0;

    virtual std::size_t route_count() const = 0;

    /// @brief Delivers `exchange` to the endpoint named by `uri`; `done` is
    /// called exactly once
    virtual void dispatch(const std::string& uri,
                          const std::shared_ptr<Exchange>& exchange,
                          AsyncCallback done) = 0;

    virtual void stop() = 0;
};

struct EngineOptions {
    std::size_t threads = 1;
    std::chrono::milliseconds file_poll_interval{500};
};

/// @brief In-process routing engine with "direct" and "file" components.
///
/// Owns an io_context whose threads run redeliveries and file polling.
class LocalRoutingEngine : public RoutingEngine {
public:
    explicit LocalRoutingEngine(const EngineOptions& options = {});
    ~LocalRoutingEngine() override;

    LocalRoutingEngine(const LocalRoutingEngine&) = delete;
    LocalRoutingEngine& operator=(const LocalRoutingEngine&) = delete;

    /// @brief Registers an extra component; replaces one with the same scheme
    void add_component(std::shared_ptr<Component> component);

    RouteHandle create_route(RouteDefinition definition) override;
    void remove_route(const RouteHandle& handle) override;
    std::size_t route_count() const override;
    void dispatch(const std::string& uri,
                  const std::shared_ptr<Exchange>& exchange,
                  AsyncCallback done) override;
    void stop() override;

    std::vector<std::string> route_ids() const;
    boost::asio::io_context& context() { return io_context_; }

private:
    std::shared_ptr<Component> find_component(const std::string& scheme) const;

    boost::asio::io_context io_context_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
        work_guard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> stopped_{false};
    std::atomic<std::uint64_t> next_route_{0};

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Component>> components_;
    std::map<std::string, std::shared_ptr<Route>> routes_;
};

}  // namespace conduit::routing
