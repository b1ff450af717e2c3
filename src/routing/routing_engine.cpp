#include "conduit/routing/routing_engine.hpp"

#include "conduit/core/errors.hpp"
#include "conduit/log/logger.hpp"
#include "conduit/routing/direct_component.hpp"
#include "conduit/routing/file_component.hpp"
#include "conduit/routing/route.hpp"

namespace conduit::routing {

LocalRoutingEngine::LocalRoutingEngine(const EngineOptions& options)
    : work_guard_(boost::asio::make_work_guard(io_context_)) {
    add_component(std::make_shared<DirectComponent>());
    add_component(std::make_shared<FileComponent>(io_context_,
                                                  options.file_poll_interval));

    const std::size_t count = options.threads > 0 ? options.threads : 1;
    for (std::size_t i = 0; i < count; ++i) {
        threads_.emplace_back([this]() { io_context_.run(); });
    }
    CONDUIT_LOG_INFO << "LocalRoutingEngine started with " << count
                     << " thread(s)";
}

LocalRoutingEngine::~LocalRoutingEngine() { stop(); }

void LocalRoutingEngine::add_component(std::shared_ptr<Component> component) {
    std::lock_guard<std::mutex> lock(mutex_);
    components_[component->scheme()] = std::move(component);
}

std::shared_ptr<Component> LocalRoutingEngine::find_component(
    const std::string& scheme) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = components_.find(scheme);
    return it != components_.end() ? it->second : nullptr;
}

RouteHandle LocalRoutingEngine::create_route(RouteDefinition definition) {
    if (stopped_) {
        throw RouteCreationError(definition.from_uri(),
                                 "routing engine is stopped");
    }
    if (!definition.processor()) {
        throw RouteCreationError(definition.from_uri(), "route has no processor");
    }

    auto uri = EndpointUri::parse(definition.from_uri());
    auto component = find_component(uri.scheme);
    if (!component) {
        throw RouteCreationError(uri.text,
                                 "no component found with scheme: " + uri.scheme);
    }

    const std::string route_id = "route" + std::to_string(++next_route_);
    auto route = std::make_shared<Route>(route_id, uri, std::move(definition),
                                         io_context_);
    component->start_consumer(uri, route);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        routes_[route_id] = route;
    }
    CONDUIT_LOG_INFO << "Route " << route_id << " started consuming from "
                     << uri.text;
    return RouteHandle{route_id, uri.text};
}

void LocalRoutingEngine::remove_route(const RouteHandle& handle) {
    std::shared_ptr<Route> route;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = routes_.find(handle.route_id);
        if (it == routes_.end()) {
            return;
        }
        route = std::move(it->second);
        routes_.erase(it);
    }

    if (auto component = find_component(route->from().scheme)) {
        component->stop_consumer(route->from());
    }
    CONDUIT_LOG_INFO << "Route " << handle.route_id << " stopped ("
                     << route->from().text << ")";
}

std::size_t LocalRoutingEngine::route_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return routes_.size();
}

std::vector<std::string> LocalRoutingEngine::route_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(routes_.size());
    for (const auto& [id, route] : routes_) {
        ids.push_back(id);
    }
    return ids;
}

void LocalRoutingEngine::dispatch(const std::string& uri,
                                  const std::shared_ptr<Exchange>& exchange,
                                  AsyncCallback done) {
    std::shared_ptr<Component> component;
    EndpointUri endpoint;
    try {
        endpoint = EndpointUri::parse(uri);
        component = find_component(endpoint.scheme);
    } catch (const RouteCreationError&) {
        exchange->set_exception(std::make_exception_ptr(
            ResolveEndpointError("Failed to resolve endpoint: " + uri)));
        done();
        return;
    }
    if (!component) {
        exchange->set_exception(std::make_exception_ptr(ResolveEndpointError(
            "Failed to resolve endpoint: " + uri + ", no component for scheme " +
            endpoint.scheme)));
        done();
        return;
    }
    component->send(endpoint, exchange, std::move(done));
}

void LocalRoutingEngine::stop() {
    if (stopped_.exchange(true)) {
        return;
    }

    for (const auto& id : route_ids()) {
        remove_route(RouteHandle{id, {}});
    }

    // Drain instead of stopping the context: pending redeliveries and
    // dispatches still complete their exchanges.
    work_guard_.reset();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    CONDUIT_LOG_INFO << "LocalRoutingEngine stopped";
}

}  // namespace conduit::routing
