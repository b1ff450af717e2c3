#include "conduit/bridge/activation_tracker.hpp"

#include "conduit/core/errors.hpp"
#include "conduit/log/logger.hpp"

namespace conduit::bridge {

const char* to_string(ActivationState state) {
    switch (state) {
        case ActivationState::UNREGISTERED:
            return "unregistered";
        case ActivationState::ACTIVATING:
            return "activating";
        case ActivationState::ACTIVE:
            return "active";
        case ActivationState::FAILED:
            return "failed";
        case ActivationState::DEACTIVATING:
            return "deactivating";
        case ActivationState::INACTIVE:
            return "inactive";
    }
    return "unknown";
}

bool ActivationTracker::mark_activating(ActorId id,
                                        const std::string& endpoint_uri) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& entry = entries_[id];
        if (entry.state != ActivationState::UNREGISTERED &&
            entry.state != ActivationState::INACTIVE) {
            CONDUIT_LOG_WARN << "Actor #" << id << " cannot start activating "
                             << endpoint_uri << " while "
                             << to_string(entry.state);
            return false;
        }
        entry = Entry{};
        entry.state = ActivationState::ACTIVATING;
        entry.endpoint_uri = endpoint_uri;
    }
    changed_.notify_all();
    CONDUIT_LOG_DEBUG << "Actor #" << id << " activating " << endpoint_uri;
    return true;
}

bool ActivationTracker::mark_active(ActorId id) {
    return transition(id, ActivationState::ACTIVATING, ActivationState::ACTIVE);
}

bool ActivationTracker::mark_failed(ActorId id, std::exception_ptr error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end() ||
            it->second.state != ActivationState::ACTIVATING) {
            return false;
        }
        it->second.state = ActivationState::FAILED;
        it->second.error = std::move(error);
        CONDUIT_LOG_ERROR << "Actor #" << id << " failed to activate "
                          << it->second.endpoint_uri << ": "
                          << describe(it->second.error);
    }
    changed_.notify_all();
    return true;
}

bool ActivationTracker::mark_deactivating(ActorId id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return false;
        }
        auto& entry = it->second;
        switch (entry.state) {
            case ActivationState::ACTIVE:
                --active_count_;
                [[fallthrough]];
            case ActivationState::ACTIVATING:
                entry.state = ActivationState::DEACTIVATING;
                break;
            case ActivationState::FAILED:
                // Nothing to tear down.
                entry.state = ActivationState::INACTIVE;
                break;
            default:
                return false;
        }
    }
    changed_.notify_all();
    CONDUIT_LOG_DEBUG << "Actor #" << id << " deactivating";
    return true;
}

bool ActivationTracker::mark_inactive(ActorId id) {
    return transition(id, ActivationState::DEACTIVATING,
                      ActivationState::INACTIVE);
}

bool ActivationTracker::transition(ActorId id, ActivationState from,
                                   ActivationState to) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end() || it->second.state != from) {
            CONDUIT_LOG_DEBUG << "Ignoring transition of actor #" << id << " to "
                              << to_string(to) << ", not "
                              << to_string(from);
            return false;
        }
        it->second.state = to;
        if (to == ActivationState::ACTIVE) {
            it->second.was_active = true;
            ++active_count_;
        }
    }
    changed_.notify_all();
    CONDUIT_LOG_DEBUG << "Actor #" << id << " is now " << to_string(to);
    return true;
}

ActivationState ActivationTracker::state(ActorId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    return it != entries_.end() ? it->second.state
                                : ActivationState::UNREGISTERED;
}

void ActivationTracker::await_activation(
    ActorId id, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto settled = [this, id]() {
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return false;
        }
        auto state = it->second.state;
        return state != ActivationState::UNREGISTERED &&
               state != ActivationState::ACTIVATING;
    };

    if (!changed_.wait_for(lock, timeout, settled)) {
        throw TimeoutError("Timed out after " + format_duration(timeout) +
                           " awaiting activation of actor #" +
                           std::to_string(id));
    }

    const auto& entry = entries_.at(id);
    switch (entry.state) {
        case ActivationState::ACTIVE:
            return;
        case ActivationState::FAILED:
            std::rethrow_exception(entry.error);
        default:
            if (entry.was_active) {
                return;
            }
            throw Error("Actor #" + std::to_string(id) +
                        " was stopped before its route from " +
                        entry.endpoint_uri + " became active");
    }
}

void ActivationTracker::await_deactivation(
    ActorId id, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto settled = [this, id]() {
        auto it = entries_.find(id);
        return it != entries_.end() &&
               (it->second.state == ActivationState::INACTIVE ||
                it->second.state == ActivationState::FAILED);
    };

    if (!changed_.wait_for(lock, timeout, settled)) {
        throw TimeoutError("Timed out after " + format_duration(timeout) +
                           " awaiting deactivation of actor #" +
                           std::to_string(id));
    }
}

std::size_t ActivationTracker::route_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_count_;
}

}  // namespace conduit::bridge
