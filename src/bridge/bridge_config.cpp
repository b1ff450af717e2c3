#include "conduit/bridge/bridge_config.hpp"

#include <stdexcept>

namespace conduit::bridge {

void BridgeConfig::from_ptree(const boost::property_tree::ptree& pt) {
    reply_timeout_ms = get_value(pt, "reply_timeout_ms", reply_timeout_ms);
    activation_timeout_ms =
        get_value(pt, "activation_timeout_ms", activation_timeout_ms);
    coordinator_threads =
        get_value(pt, "coordinator_threads", coordinator_threads);
    file_poll_interval_ms =
        get_value(pt, "file_poll_interval_ms", file_poll_interval_ms);
    actor_threads = get_value(pt, "actor_threads", actor_threads);
}

void BridgeConfig::validate() const {
    if (reply_timeout_ms <= 0) {
        throw std::invalid_argument(
            "bridge.reply_timeout_ms must be greater than 0");
    }
    if (activation_timeout_ms <= 0) {
        throw std::invalid_argument(
            "bridge.activation_timeout_ms must be greater than 0");
    }
    if (coordinator_threads <= 0) {
        throw std::invalid_argument(
            "bridge.coordinator_threads must be greater than 0");
    }
    if (file_poll_interval_ms <= 0) {
        throw std::invalid_argument(
            "bridge.file_poll_interval_ms must be greater than 0");
    }
    if (actor_threads < 0) {
        throw std::invalid_argument("bridge.actor_threads must not be negative");
    }
}

}  // namespace conduit::bridge
