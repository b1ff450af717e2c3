#include "conduit/bridge/bridge.hpp"

#include <atomic>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <map>
#include <mutex>
#include <vector>

#include "caf/actor_system.hpp"
#include "caf/error.hpp"
#include "caf/exit_reason.hpp"
#include "caf/send.hpp"
#include "conduit/bridge/consumer_processor.hpp"
#include "conduit/core/errors.hpp"
#include "conduit/log/logger.hpp"

namespace conduit::bridge {

namespace {

routing::EngineOptions engine_options(const BridgeConfig& config) {
    routing::EngineOptions options;
    options.file_poll_interval = config.file_poll_interval();
    return options;
}

std::string actor_name(caf::actor_id id) {
    return "consumer#" + std::to_string(id);
}

}  // namespace

// Lifecycle steps (route build and teardown) run serialized on a strand of
// the coordinator's io_context. Actor exit handlers only hold a weak
// reference to the core.
struct Bridge::Core {
    explicit Core(const BridgeConfig& cfg)
        : config(cfg),
          engine(engine_options(cfg)),
          coordinator(std::make_shared<ReplyCoordinator>(
              static_cast<std::size_t>(cfg.coordinator_threads))),
          lifecycle(boost::asio::make_strand(coordinator->context())),
          producer(engine, [this](std::function<void()> task) {
              boost::asio::post(engine.context(), std::move(task));
          }) {}

    void activate(caf::actor_id id, routing::RouteDefinition definition);
    void deactivate(caf::actor_id id);

    BridgeConfig config;
    ActivationTracker tracker;
    routing::LocalRoutingEngine engine;
    std::shared_ptr<ReplyCoordinator> coordinator;
    boost::asio::strand<boost::asio::io_context::executor_type> lifecycle;
    routing::ProducerTemplate producer;
    std::atomic<bool> stopped{false};

    std::mutex mutex;
    std::map<caf::actor_id, routing::RouteHandle> routes;
    std::map<caf::actor_id, caf::actor> consumers;
};

void Bridge::Core::activate(caf::actor_id id,
                            routing::RouteDefinition definition) {
    if (tracker.state(id) != ActivationState::ACTIVATING) {
        CONDUIT_LOG_DEBUG << "Skipping route build for " << actor_name(id)
                          << ", actor already stopped";
        return;
    }

    routing::RouteHandle handle;
    try {
        handle = engine.create_route(std::move(definition));
    } catch (const RouteCreationError&) {
        tracker.mark_failed(id, std::current_exception());
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        routes[id] = handle;
    }
    // An actor stopping meanwhile has already queued deactivate() behind
    // this step, which removes the route again.
    if (tracker.mark_active(id)) {
        CONDUIT_LOG_INFO << actor_name(id) << " activated route "
                         << handle.route_id << " from "
                         << handle.endpoint_uri;
    }
}

void Bridge::Core::deactivate(caf::actor_id id) {
    routing::RouteHandle handle;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = routes.find(id);
        if (it != routes.end()) {
            handle = std::move(it->second);
            routes.erase(it);
        }
        consumers.erase(id);
    }
    if (handle) {
        engine.remove_route(handle);
        CONDUIT_LOG_INFO << actor_name(id) << " deactivated route "
                         << handle.route_id;
    }
    tracker.mark_inactive(id);
}

Bridge::Bridge(caf::actor_system& system, BridgeConfig config)
    : system_(system) {
    config.validate();
    core_ = std::make_shared<Core>(config);
    CONDUIT_LOG_DEBUG << "Bridge started (reply timeout "
                      << format_duration(config.reply_timeout()) << ")";
}

Bridge::~Bridge() { shutdown(); }

caf::actor Bridge::spawn_consumer(ConsumerFactory factory) {
    if (core_->stopped) {
        throw Error("Cannot spawn a consumer on a bridge that was shut down");
    }

    std::shared_ptr<Consumer> prototype = factory();
    ConsumerSettings settings;
    settings.endpoint_uri = prototype->endpoint_uri();
    settings.reply_timeout =
        prototype->reply_timeout().value_or(core_->config.reply_timeout());
    settings.blocking = prototype->blocking();
    settings.protocol = prototype->protocol();
    routing::ErrorPolicy policy = prototype->route_policy();

    caf::actor actor =
        system_.spawn<ConsumerActor>(std::move(factory), std::move(prototype));
    const caf::actor_id id = actor.id();

    core_->tracker.mark_activating(id, settings.endpoint_uri);
    {
        std::lock_guard<std::mutex> lock(core_->mutex);
        core_->consumers[id] = actor;
    }

    std::weak_ptr<Core> weak_core = core_;
    actor->attach_functor([weak_core, id](const caf::error& reason) {
        auto core = weak_core.lock();
        if (!core) {
            return;
        }
        CONDUIT_LOG_DEBUG << actor_name(id)
                          << " terminated: " << caf::to_string(reason);
        if (core->tracker.mark_deactivating(id)) {
            boost::asio::post(core->lifecycle, [weak_core, id]() {
                if (auto core = weak_core.lock()) {
                    core->deactivate(id);
                }
            });
        }
    });

    auto processor = std::make_shared<ConsumerProcessor>(
        actor.address(), actor_name(id), settings, core_->coordinator);
    routing::RouteDefinition definition(settings.endpoint_uri, processor);
    definition.set_error_policy(std::move(policy))
        .set_description(actor_name(id));

    boost::asio::post(core_->lifecycle,
                      [weak_core, id, definition]() mutable {
                          if (auto core = weak_core.lock()) {
                              core->activate(id, std::move(definition));
                          }
                      });
    return actor;
}

void Bridge::await_activation(const caf::actor& actor,
                              std::chrono::milliseconds timeout) const {
    core_->tracker.await_activation(actor.id(), timeout);
}

void Bridge::await_activation(const caf::actor& actor) const {
    await_activation(actor, core_->config.activation_timeout());
}

void Bridge::await_deactivation(const caf::actor& actor,
                                std::chrono::milliseconds timeout) const {
    core_->tracker.await_deactivation(actor.id(), timeout);
}

void Bridge::await_deactivation(const caf::actor& actor) const {
    await_deactivation(actor, core_->config.activation_timeout());
}

void Bridge::stop(const caf::actor& actor) {
    caf::anon_send_exit(actor, caf::exit_reason::user_shutdown);
}

std::size_t Bridge::route_count() const { return core_->tracker.route_count(); }

std::any Bridge::send_to(const std::string& uri, std::any body,
                         Headers headers) {
    return core_->producer.request_body(uri, std::move(body),
                                        std::move(headers));
}

routing::ProducerTemplate& Bridge::producer() { return core_->producer; }

routing::LocalRoutingEngine& Bridge::engine() { return core_->engine; }

const ActivationTracker& Bridge::tracker() const { return core_->tracker; }

ReplyCoordinator& Bridge::coordinator() { return *core_->coordinator; }

const BridgeConfig& Bridge::config() const { return core_->config; }

void Bridge::shutdown() {
    bool expected = false;
    if (!core_->stopped.compare_exchange_strong(expected, true)) {
        return;
    }
    CONDUIT_LOG_INFO << "Shutting down bridge";

    std::map<caf::actor_id, caf::actor> consumers;
    std::map<caf::actor_id, routing::RouteHandle> routes;
    {
        std::lock_guard<std::mutex> lock(core_->mutex);
        consumers.swap(core_->consumers);
        routes.swap(core_->routes);
    }

    for (auto& [id, actor] : consumers) {
        caf::anon_send_exit(actor, caf::exit_reason::user_shutdown);
    }
    core_->coordinator->stop();
    for (auto& [id, handle] : routes) {
        core_->engine.remove_route(handle);
    }
    core_->engine.stop();

    for (auto& [id, actor] : consumers) {
        core_->tracker.mark_deactivating(id);
        core_->tracker.mark_inactive(id);
    }
}

}  // namespace conduit::bridge
