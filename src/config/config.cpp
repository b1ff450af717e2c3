#include "conduit/config/config.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <fstream>
#include <sstream>

#include "conduit/log/logger.hpp"

namespace conduit::config {

ConfigFormat format_from_path(const std::string& path) {
    if (boost::algorithm::iends_with(path, ".json")) return ConfigFormat::JSON;
    if (boost::algorithm::iends_with(path, ".ini")) return ConfigFormat::INI;
    return ConfigFormat::YAML;
}

boost::property_tree::ptree yaml_to_ptree(const YAML::Node& node) {
    boost::property_tree::ptree pt;
    if (node.IsMap()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            pt.add_child(it->first.as<std::string>(),
                         yaml_to_ptree(it->second));
        }
    } else if (node.IsSequence()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            pt.push_back({"", yaml_to_ptree(*it)});
        }
    } else if (node.IsScalar()) {
        pt.put_value(node.as<std::string>());
    }
    return pt;
}

boost::property_tree::ptree read_tree(std::istream& input,
                                      ConfigFormat format) {
    boost::property_tree::ptree tree;
    switch (format) {
        case ConfigFormat::YAML:
            tree = yaml_to_ptree(YAML::Load(input));
            break;
        case ConfigFormat::JSON:
            boost::property_tree::read_json(input, tree);
            break;
        case ConfigFormat::INI:
            boost::property_tree::read_ini(input, tree);
            break;
    }
    return tree;
}

namespace {

boost::property_tree::ptree read_file(const std::string& config_file,
                                      ConfigFormat format) {
    std::ifstream ifs(config_file);
    if (!ifs) {
        throw std::runtime_error("Cannot open config file: " + config_file);
    }
    return read_tree(ifs, format);
}

}  // namespace

void ConfigManager::load_config(const std::string& config_file,
                                ConfigFormat format) {
    CONDUIT_LOG_INFO << "Loading config file: " << config_file;

    try {
        apply_tree(read_file(config_file, format));
        CONDUIT_LOG_INFO << "Successfully loaded config file: " << config_file;
    } catch (const std::exception& e) {
        CONDUIT_LOG_ERROR << "Failed to load config file: " << config_file
                          << ", Error: " << e.what();
        throw std::runtime_error("Failed to load config file: " + config_file +
                                 ", Error: " + e.what());
    }
}

void ConfigManager::load_config_from_string(const std::string& content,
                                            ConfigFormat format) {
    std::istringstream input(content);
    try {
        apply_tree(read_tree(input, format));
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Failed to load config: ") +
                                 e.what());
    }
}

void ConfigManager::apply_tree(boost::property_tree::ptree tree) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_tree_ = std::move(tree);
    load_component_configs();
}

void ConfigManager::load_component_configs() {
    for (auto& [type_id, config] : configs_) {
        const std::string properties_name = config->properties_name();
        auto subtree = config_tree_.get_child_optional(properties_name);
        if (!subtree) {
            CONDUIT_LOG_DEBUG << "No configuration found for properties: "
                              << properties_name << ", using defaults";
            continue;
        }

        try {
            config->from_ptree(*subtree);
            config->validate();
            CONDUIT_LOG_DEBUG << "Loaded configuration for properties: "
                              << properties_name;
        } catch (const std::exception& e) {
            CONDUIT_LOG_ERROR << "Failed to load configuration for properties "
                              << properties_name << ": " << e.what();
            throw;
        }
    }
}

void ConfigManager::reload_config(const std::string& config_file,
                                  ConfigFormat format) {
    CONDUIT_LOG_INFO << "Attempting to reload config from: " << config_file;

    boost::property_tree::ptree new_config_tree;
    try {
        new_config_tree = read_file(config_file, format);
    } catch (const std::exception& e) {
        CONDUIT_LOG_ERROR
            << "Failed to parse new config file, aborting reload: " << e.what();
        return;
    }

    // Populate and validate clones first so a bad file changes nothing
    std::unordered_map<std::type_index,
                       std::shared_ptr<ConfigurationProperties>>
        validated_new_configs;
    try {
        std::lock_guard<std::mutex> lock(config_mutex_);
        for (auto const& [type_id, current_config] : configs_) {
            if (!current_config->supports_hot_reload()) {
                continue;
            }
            auto subtree = new_config_tree.get_child_optional(
                current_config->properties_name());
            if (!subtree) {
                continue;
            }

            std::shared_ptr<ConfigurationProperties> new_config =
                current_config->clone();
            new_config->from_ptree(*subtree);
            new_config->validate();
            validated_new_configs[type_id] = std::move(new_config);
        }
    } catch (const std::exception& e) {
        CONDUIT_LOG_ERROR
            << "Failed to validate new configuration, aborting reload: "
            << e.what();
        return;
    }

    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_tree_ = new_config_tree;
        for (auto const& [type_id, new_config] : validated_new_configs) {
            configs_[type_id] = new_config;
            config_by_name_[new_config->properties_name()] = new_config;
        }
    }
    CONDUIT_LOG_INFO << "Successfully applied new configuration.";

    std::vector<std::pair<ReloadCallback,
                          std::shared_ptr<const ConfigurationProperties>>>
        callbacks_to_run;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        for (const auto& [type_id, new_config] : validated_new_configs) {
            auto it = reload_subscribers_.find(type_id);
            if (it != reload_subscribers_.end()) {
                for (const auto& callback : it->second) {
                    callbacks_to_run.push_back({callback, new_config});
                }
            }
        }
    }

    for (const auto& [callback, config_ptr] : callbacks_to_run) {
        try {
            callback(*config_ptr);
        } catch (const std::exception& e) {
            CONDUIT_LOG_ERROR
                << "Exception in config reload callback for properties '"
                << config_ptr->properties_name() << "': " << e.what();
        }
    }
}

}  // namespace conduit::config
