#pragma once

#include <boost/asio/io_context.hpp>
#include <memory>
#include <string>

#include "conduit/routing/endpoint_uri.hpp"
#include "conduit/routing/exchange.hpp"
#include "conduit/routing/route_definition.hpp"

namespace conduit::routing {

/// @brief A running route: feeds exchanges from its endpoint into the
/// definition's processor and applies the error policy to failures,
/// including redelivery.
class Route : public Processor, public std::enable_shared_from_this<Route> {
public:
    Route(std::string id, EndpointUri from, RouteDefinition definition,
          boost::asio::io_context& io_context);

    const std::string& id() const { return id_; }
    const EndpointUri& from() const { return from_; }
    const RouteDefinition& definition() const { return definition_; }

    void process(const std::shared_ptr<Exchange>& exchange,
                 AsyncCallback done) override;

private:
    void attempt(const std::shared_ptr<Exchange>& exchange,
                 AsyncCallback done, int redeliveries);
    void on_attempt_done(const std::shared_ptr<Exchange>& exchange,
                         AsyncCallback done, int redeliveries);

    std::string id_;
    EndpointUri from_;
    RouteDefinition definition_;
    boost::asio::io_context& io_context_;
};

}  // namespace conduit::routing
