#pragma once

#include <yaml-cpp/yaml.h>

#include <boost/property_tree/ptree.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace conduit::config {

class ConfigPaths {
public:
    static constexpr const char* DEFAULT_CONFIG_FILE = "config/conduit.yaml";
};

enum class ConfigFormat { YAML, JSON, INI };

/// @brief Picks the format from a file extension; YAML when unknown
ConfigFormat format_from_path(const std::string& path);

// A typed view of one top-level config section
class ConfigurationProperties {
public:
    virtual ~ConfigurationProperties() = default;
    virtual void from_ptree(const boost::property_tree::ptree& pt) = 0;
    virtual void validate() const {}
    virtual std::string properties_name() const = 0;
    virtual bool supports_hot_reload() const { return false; }
    virtual std::unique_ptr<ConfigurationProperties> clone() const = 0;

protected:
    template <typename T>
    T get_value(const boost::property_tree::ptree& pt, const std::string& path,
                const T& default_value) {
        return pt.get<T>(path, default_value);
    }

    template <typename T>
    std::optional<T> get_optional_value(const boost::property_tree::ptree& pt,
                                        const std::string& path) {
        auto result = pt.get_optional<T>(path);
        if (result) {
            return *result;
        }
        return std::nullopt;
    }
};

// CRTP template for providing automatic clone() implementation
template <typename Derived>
class ClonableConfigurationProperties : public ConfigurationProperties {
public:
    std::unique_ptr<ConfigurationProperties> clone() const override {
        return std::make_unique<Derived>(static_cast<const Derived&>(*this));
    }
};

template <typename Derived>
class ReloadableConfigurationProperties
    : public ClonableConfigurationProperties<Derived> {
public:
    bool supports_hot_reload() const override { return true; }
};

class ConfigManager {
public:
    static ConfigManager& instance() {
        static ConfigManager instance;
        return instance;
    }

    void load_config(const std::string& config_file,
                     ConfigFormat format = ConfigFormat::YAML);

    /// @brief Loads configuration text instead of a file
    void load_config_from_string(const std::string& content,
                                 ConfigFormat format = ConfigFormat::YAML);

    // Re-reads the file; on any parse or validation error the old
    // configuration stays active
    void reload_config(const std::string& config_file,
                       ConfigFormat format = ConfigFormat::YAML);

    template <typename T>
    void register_configuration_properties(std::shared_ptr<T> config) {
        static_assert(std::is_base_of_v<ConfigurationProperties, T>,
                      "T must inherit from ConfigurationProperties");
        std::lock_guard<std::mutex> lock(config_mutex_);
        configs_[std::type_index(typeid(T))] = config;
        config_by_name_[config->properties_name()] = config;
    }

    template <typename T>
    std::shared_ptr<T> get_configuration_properties() const {
        std::lock_guard<std::mutex> lock(config_mutex_);
        auto it = configs_.find(std::type_index(typeid(T)));
        if (it != configs_.end()) {
            return std::static_pointer_cast<T>(it->second);
        }
        return nullptr;
    }

    std::shared_ptr<ConfigurationProperties> get_config_by_name(
        const std::string& name) const {
        std::lock_guard<std::mutex> lock(config_mutex_);
        auto it = config_by_name_.find(name);
        return (it != config_by_name_.end()) ? it->second : nullptr;
    }

    void reset() {
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            configs_.clear();
            config_by_name_.clear();
            config_tree_ = boost::property_tree::ptree();
        }
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        reload_subscribers_.clear();
    }

    const boost::property_tree::ptree& get_config_tree() const {
        return config_tree_;
    }

    // The callback runs after a successful reload of ConfigType
    template <typename ConfigType>
    void subscribe_to_reloads(
        std::function<void(const ConfigType& new_config)> callback) {
        static_assert(
            std::is_base_of_v<ReloadableConfigurationProperties<ConfigType>,
                              ConfigType>,
            "Can only subscribe to types derived from "
            "ReloadableConfigurationProperties");

        ReloadCallback generic_callback =
            [cb = std::move(callback)](const ConfigurationProperties& config) {
                cb(static_cast<const ConfigType&>(config));
            };

        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        reload_subscribers_[std::type_index(typeid(ConfigType))].push_back(
            std::move(generic_callback));
    }

private:
    ConfigManager() = default;

    using ReloadCallback =
        std::function<void(const ConfigurationProperties& new_config)>;

    void apply_tree(boost::property_tree::ptree tree);
    void load_component_configs();

    mutable std::mutex config_mutex_;
    std::unordered_map<std::type_index,
                       std::shared_ptr<ConfigurationProperties>>
        configs_;
    std::unordered_map<std::string, std::shared_ptr<ConfigurationProperties>>
        config_by_name_;
    boost::property_tree::ptree config_tree_;

    std::mutex subscribers_mutex_;
    std::unordered_map<std::type_index, std::vector<ReloadCallback>>
        reload_subscribers_;
};

/// @brief Parses configuration text into a property tree
boost::property_tree::ptree read_tree(std::istream& input, ConfigFormat format);

boost::property_tree::ptree yaml_to_ptree(const YAML::Node& node);

}  // namespace conduit::config
