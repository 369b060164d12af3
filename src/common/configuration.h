#ifndef ESTUARY_CONFIGURATION_H_
#define ESTUARY_CONFIGURATION_H_

#include <string>
#include <memory>
#include <optional>
#include <vector>
#include <cstdint>

namespace YAML {
class Node;
}

namespace Estuary {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct EstuaryConfig {
    struct Version {
        ConfigValue<int> major{1, "ESTUARY_VERSION_MAJOR"};
        ConfigValue<int> minor{0, "ESTUARY_VERSION_MINOR"};
    } version;

    // Merge store and presence behaviour
    struct Sync {
        ConfigValue<int> typing_validity_seconds{60, "ESTUARY_TYPING_VALIDITY_SECONDS"};
        // 0 keeps the historical rule: any status record marks the project online.
        ConfigValue<int> status_online_window_seconds{0, "ESTUARY_STATUS_ONLINE_WINDOW_SECONDS"};
        ConfigValue<size_t> replay_buffer_size{1024, "ESTUARY_REPLAY_BUFFER_SIZE"};
        ConfigValue<size_t> max_pending_refreshes{64, "ESTUARY_MAX_PENDING_REFRESHES"};
    } sync;

    // Cache policy names: cache_only, network_only, cache_then_network
    struct Subscriptions {
        ConfigValue<std::string> project_cache_policy{"cache_then_network", "ESTUARY_PROJECT_CACHE_POLICY"};
        ConfigValue<std::string> status_cache_policy{"cache_then_network", "ESTUARY_STATUS_CACHE_POLICY"};
        ConfigValue<std::string> content_cache_policy{"cache_then_network", "ESTUARY_CONTENT_CACHE_POLICY"};
        ConfigValue<std::string> typing_cache_policy{"network_only", "ESTUARY_TYPING_CACHE_POLICY"};
        ConfigValue<int> collect_timeout_ms{3000, "ESTUARY_COLLECT_TIMEOUT_MS"};
    } subscriptions;

    struct Transport {
        std::vector<std::string> relays{"wss://relay.primal.net", "wss://relay.damus.io", "wss://nos.lol"};
    } transport;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Override with command line arguments
    void overrideFromCommandLine(int argc, char* argv[]);

    // Get the configuration
    const EstuaryConfig& config() const { return config_; }
    EstuaryConfig& config() { return config_; }

    // Back to compiled-in defaults (tests and reloads)
    void resetToDefaults() { config_ = EstuaryConfig{}; validation_errors_.clear(); }

    int getTypingValiditySeconds() const { return config_.sync.typing_validity_seconds.get(); }
    int getCollectTimeoutMs() const { return config_.subscriptions.collect_timeout_ms.get(); }
    std::vector<std::string> getRelays() const { return config_.transport.relays; }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    EstuaryConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& yaml);
    bool validateConfig();
};

const Configuration& GetConfig();

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Estuary

#endif // ESTUARY_CONFIGURATION_H_
