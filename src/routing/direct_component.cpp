#include "conduit/routing/direct_component.hpp"

#include "conduit/core/errors.hpp"
#include "conduit/log/logger.hpp"
#include "conduit/routing/route.hpp"

namespace conduit::routing {

void DirectComponent::start_consumer(const EndpointUri& uri,
                                     std::shared_ptr<Route> route) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = consumers_.emplace(uri.path, route);
    if (!inserted) {
        throw RouteCreationError(
            uri.text, "endpoint direct:" + uri.path +
                          " already has a consumer (route " +
                          it->second->id() + ")");
    }
    CONDUIT_LOG_DEBUG << "direct:" << uri.path << " consumed by route "
                      << route->id();
}

void DirectComponent::stop_consumer(const EndpointUri& uri) {
    std::lock_guard<std::mutex> lock(mutex_);
    consumers_.erase(uri.path);
}

void DirectComponent::send(const EndpointUri& uri,
                           const std::shared_ptr<Exchange>& exchange,
                           AsyncCallback done) {
    std::shared_ptr<Route> route;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = consumers_.find(uri.path);
        if (it != consumers_.end()) {
            route = it->second;
        }
    }

    if (!route) {
        exchange->set_exception(std::make_exception_ptr(NoConsumerError(
            "No consumers available on endpoint: direct:" + uri.path)));
        done();
        return;
    }
    route->process(exchange, std::move(done));
}

}  // namespace conduit::routing
