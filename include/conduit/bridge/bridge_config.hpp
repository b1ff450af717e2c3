#pragma once

#include <chrono>
#include <cstddef>

#include "conduit/config/config.hpp"

namespace conduit::bridge {

// Bridge configuration, read from the "bridge" section
class BridgeConfig
    : public config::ReloadableConfigurationProperties<BridgeConfig> {
public:
    int reply_timeout_ms = 60000;
    int activation_timeout_ms = 10000;
    int coordinator_threads = 1;
    int file_poll_interval_ms = 500;
    int actor_threads = 0;  // 0 = one per hardware thread

    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;
    std::string properties_name() const override { return "bridge"; }

    std::chrono::milliseconds reply_timeout() const {
        return std::chrono::milliseconds(reply_timeout_ms);
    }
    std::chrono::milliseconds activation_timeout() const {
        return std::chrono::milliseconds(activation_timeout_ms);
    }
    std::chrono::milliseconds file_poll_interval() const {
        return std::chrono::milliseconds(file_poll_interval_ms);
    }
};

}  // namespace conduit::bridge
