#pragma once

#include <memory>
#include <string>

#include "conduit/routing/endpoint_uri.hpp"
#include "conduit/routing/exchange.hpp"

namespace conduit::routing {

class Route;

/// @brief A transport reachable under one URI scheme
class Component {
public:
    virtual ~Component() = default;

    virtual std::string scheme() const = 0;

    /// @brief Starts consuming from `uri` into `route`.
    /// Throws RouteCreationError when the endpoint cannot be consumed.
    virtual void start_consumer(const EndpointUri& uri,
                                std::shared_ptr<Route> route) = 0;

    virtual void stop_consumer(const EndpointUri& uri) = 0;

    /// @brief Producer side: hands `exchange` to the endpoint. `done` is
    /// called exactly once.
    virtual void send(const EndpointUri& uri,
                      const std::shared_ptr<Exchange>& exchange,
                      AsyncCallback done) = 0;
};

}  // namespace conduit::routing
