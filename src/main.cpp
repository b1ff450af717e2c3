#include <iostream>
#include <memory>
#include <string>

#include "caf/actor_system.hpp"
#include "caf/actor_system_config.hpp"
#include "conduit/bridge/bridge.hpp"
#include "conduit/bridge/bridge_config.hpp"
#include "conduit/caf_type_ids.hpp"
#include "conduit/cli/command_line_parser.hpp"
#include "conduit/config/config.hpp"
#include "conduit/core/errors.hpp"
#include "conduit/log/log_config.hpp"
#include "conduit/log/logger.hpp"
#include "conduit/version.hpp"

namespace {

class EchoConsumer : public conduit::bridge::Consumer {
public:
    explicit EchoConsumer(std::string uri) : uri_(std::move(uri)) {}

    std::string endpoint_uri() const override { return uri_; }

    void receive(const conduit::Message& message,
                 conduit::bridge::Sender& sender) override {
        sender.reply("received " + message.body_as<std::string>());
    }

private:
    std::string uri_;
};

int run(const conduit::cli::CommandLineOptions& options) {
    auto& config_manager = conduit::config::ConfigManager::instance();
    auto log_config = std::make_shared<conduit::log::LogConfig>();
    auto bridge_config = std::make_shared<conduit::bridge::BridgeConfig>();
    config_manager.register_configuration_properties(log_config);
    config_manager.register_configuration_properties(bridge_config);

    conduit::log::Logger::init(*log_config);
    if (!options.config_file.empty()) {
        config_manager.load_config(
            options.config_file,
            conduit::config::format_from_path(options.config_file));
        conduit::log::Logger::init(*log_config);
    }

    conduit::init_caf_types();
    caf::actor_system_config cfg;
    if (bridge_config->actor_threads > 0) {
        cfg.set("caf.scheduler.max-threads",
                static_cast<size_t>(bridge_config->actor_threads));
    }
    caf::actor_system system{cfg};

    int rc = 0;
    {
        conduit::bridge::Bridge bridge(system, *bridge_config);
        auto echo = bridge.spawn<EchoConsumer>(options.endpoint);
        bridge.await_activation(echo);
        CONDUIT_LOG_INFO << "Echo consumer listening on " << options.endpoint;

        for (const auto& body : options.bodies) {
            try {
                conduit::Message reply(bridge.send_to(options.endpoint, body));
                std::cout << reply.body_as<std::string>() << std::endl;
            } catch (const conduit::ExecutionError& e) {
                std::cerr << e.what() << ": " << conduit::describe(e.cause())
                          << std::endl;
                rc = 1;
            }
        }

        bridge.stop(echo);
        bridge.await_deactivation(echo);
    }

    conduit::log::Logger::shutdown();
    return rc;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto options = conduit::cli::CommandLineParser::parse(argc, argv);
    if (options.show_help) {
        std::cout << options.usage << std::endl;
        return options.parse_error ? 1 : 0;
    }
    if (options.show_version) {
        std::cout << "conduit v" << conduit::VERSION << std::endl;
        return 0;
    }

    try {
        return run(options);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
