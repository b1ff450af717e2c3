#pragma once

#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <string>
#include <unordered_map>

#include "caf/fwd.hpp"

namespace conduit::bridge {

enum class ActivationState {
    UNREGISTERED,
    ACTIVATING,
    ACTIVE,
    FAILED,
    DEACTIVATING,
    INACTIVE
};

const char* to_string(ActivationState state);

/// @brief Process-wide view of the route lifecycle of every consumer actor.
///
/// The consumer adapter reports transitions; callers block on them. The
/// tracker never triggers a transition itself. Waiters are woken by a
/// condition variable on every change.
///
/// Entries are kept after an actor reaches Inactive so that a waiter
/// arriving late still sees the settled state. CAF never reuses actor ids,
/// so a dropped entry would be indistinguishable from one not yet spawned.
/// The cost is one small Entry per consumer actor spawned by the process.
class ActivationTracker {
public:
    using ActorId = caf::actor_id;

    /// @brief Unregistered or Inactive -> Activating
    bool mark_activating(ActorId id, const std::string& endpoint_uri);

    /// @brief Activating -> Active
    bool mark_active(ActorId id);

    /// @brief Activating -> Failed, keeping the route build error
    bool mark_failed(ActorId id, std::exception_ptr error);

    /// @brief Activating/Active -> Deactivating; Failed -> Inactive
    bool mark_deactivating(ActorId id);

    /// @brief Deactivating -> Inactive
    bool mark_inactive(ActorId id);

    ActivationState state(ActorId id) const;

    /// @brief Returns once the actor's route is Active. Rethrows the
    /// RouteCreationError of a failed build; throws TimeoutError while still
    /// activating past `timeout`, Error when the actor stopped before its
    /// route became active.
    void await_activation(ActorId id, std::chrono::milliseconds timeout) const;

    /// @brief Returns once the actor's route is Inactive (or was never built)
    void await_deactivation(ActorId id, std::chrono::milliseconds timeout) const;

    /// @brief Number of actors whose route is Active
    std::size_t route_count() const;

private:
    struct Entry {
        ActivationState state = ActivationState::UNREGISTERED;
        std::string endpoint_uri;
        std::exception_ptr error;
        bool was_active = false;
    };

    bool transition(ActorId id, ActivationState from, ActivationState to);

    mutable std::mutex mutex_;
    mutable std::condition_variable changed_;
    std::unordered_map<ActorId, Entry> entries_;
    std::size_t active_count_ = 0;
};

}  // namespace conduit::bridge
