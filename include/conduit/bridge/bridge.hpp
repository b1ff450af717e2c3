#pragma once

#include <any>
#include <chrono>
#include <memory>
#include <string>
#include <type_traits>

#include "caf/actor.hpp"
#include "caf/fwd.hpp"
#include "conduit/bridge/activation_tracker.hpp"
#include "conduit/bridge/bridge_config.hpp"
#include "conduit/bridge/consumer.hpp"
#include "conduit/bridge/consumer_actor.hpp"
#include "conduit/bridge/reply_coordinator.hpp"
#include "conduit/message/message.hpp"
#include "conduit/routing/producer_template.hpp"
#include "conduit/routing/routing_engine.hpp"

namespace conduit::bridge {

/// @brief Exposes CAF actors as routing endpoints.
///
/// One Bridge serves one caf::actor_system. spawn() starts a consumer actor
/// and builds its route in the background; await_activation() observes the
/// outcome. Stopping the actor tears the route down again. A Bridge must be
/// destroyed (or shut down) before its actor system, since it keeps its
/// consumer actors alive.
class Bridge {
public:
    explicit Bridge(caf::actor_system& system, BridgeConfig config = {});
    ~Bridge();

    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    /// @brief Spawns a consumer actor running a T constructed from `args`.
    /// A copy of the arguments is kept to build fresh instances on restart.
    template <typename T, typename... Ts>
    caf::actor spawn(Ts... args) {
        static_assert(std::is_base_of_v<Consumer, T>,
                      "T must derive from conduit::bridge::Consumer");
        return spawn_consumer([args...]() -> std::unique_ptr<Consumer> {
            return std::make_unique<T>(args...);
        });
    }

    caf::actor spawn_consumer(ConsumerFactory factory);

    void await_activation(const caf::actor& actor,
                          std::chrono::milliseconds timeout) const;
    void await_activation(const caf::actor& actor) const;

    void await_deactivation(const caf::actor& actor,
                            std::chrono::milliseconds timeout) const;
    void await_deactivation(const caf::actor& actor) const;

    /// @brief Asks a consumer actor to terminate, which deactivates its route
    void stop(const caf::actor& actor);

    /// @brief Number of consumer actors with an active route
    std::size_t route_count() const;

    /// @brief In-out send; throws ExecutionError wrapping the exchange failure
    std::any send_to(const std::string& uri, std::any body,
                     Headers headers = {});

    routing::ProducerTemplate& producer();
    routing::LocalRoutingEngine& engine();
    const ActivationTracker& tracker() const;
    ReplyCoordinator& coordinator();
    const BridgeConfig& config() const;

    /// @brief Stops every consumer actor, removes every route and stops the
    /// coordinator. Later calls do nothing.
    void shutdown();

private:
    struct Core;

    caf::actor_system& system_;
    std::shared_ptr<Core> core_;
};

}  // namespace conduit::bridge
