#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "conduit/routing/component.hpp"

namespace conduit::routing {

/// @brief In-process synchronous endpoints ("direct:name").
///
/// Each name has at most one consumer; a send runs the consuming route on
/// the caller's thread.
class DirectComponent : public Component {
public:
    std::string scheme() const override { return "direct"; }

    void start_consumer(const EndpointUri& uri,
                        std::shared_ptr<Route> route) override;
    void stop_consumer(const EndpointUri& uri) override;
    void send(const EndpointUri& uri, const std::shared_ptr<Exchange>& exchange,
              AsyncCallback done) override;

private:
    std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Route>> consumers_;
};

}  // namespace conduit::routing
