#include "configuration.h"
#include <algorithm>
#include <cstdlib>
#include <getopt.h>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "transport/transport.h"

namespace Estuary {

// Global function to get configuration instance
const Configuration& GetConfig() {
    return Configuration::getInstance();
}

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoull(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["estuary"]) {
        LOG(WARNING) << "Configuration has no 'estuary' root, keeping defaults";
        return;
    }
    auto root = yaml["estuary"];

    // Version
    if (root["version"]) {
        auto version = root["version"];
        if (version["major"]) config_.version.major.set(version["major"].as<int>());
        if (version["minor"]) config_.version.minor.set(version["minor"].as<int>());
    }

    // Sync
    if (root["sync"]) {
        auto sync = root["sync"];
        if (sync["typing_validity_seconds"]) config_.sync.typing_validity_seconds.set(sync["typing_validity_seconds"].as<int>());
        if (sync["status_online_window_seconds"]) config_.sync.status_online_window_seconds.set(sync["status_online_window_seconds"].as<int>());
        if (sync["replay_buffer_size"]) config_.sync.replay_buffer_size.set(sync["replay_buffer_size"].as<size_t>());
        if (sync["max_pending_refreshes"]) config_.sync.max_pending_refreshes.set(sync["max_pending_refreshes"].as<size_t>());
    }

    // Subscriptions
    if (root["subscriptions"]) {
        auto subs = root["subscriptions"];
        if (subs["project_cache_policy"]) config_.subscriptions.project_cache_policy.set(subs["project_cache_policy"].as<std::string>());
        if (subs["status_cache_policy"]) config_.subscriptions.status_cache_policy.set(subs["status_cache_policy"].as<std::string>());
        if (subs["content_cache_policy"]) config_.subscriptions.content_cache_policy.set(subs["content_cache_policy"].as<std::string>());
        if (subs["typing_cache_policy"]) config_.subscriptions.typing_cache_policy.set(subs["typing_cache_policy"].as<std::string>());
        if (subs["collect_timeout_ms"]) config_.subscriptions.collect_timeout_ms.set(subs["collect_timeout_ms"].as<int>());
    }

    // Transport
    if (root["transport"]) {
        auto transport = root["transport"];
        if (transport["relays"]) {
            config_.transport.relays.clear();
            for (const auto& relay : transport["relays"]) {
                config_.transport.relays.push_back(relay.as<std::string>());
            }
        }
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYAML(yaml);
        return validateConfig();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYAML(yaml);
        return validateConfig();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::overrideFromCommandLine(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"typing-validity", required_argument, 0, 'y'},
        {"online-window", required_argument, 0, 'w'},
        {"replay-buffer", required_argument, 0, 'r'},
        {"collect-timeout", required_argument, 0, 'c'},
        {"config", required_argument, 0, 'f'},
        // Flags owned by the tool's own parser
        {"input", required_argument, 0, 0},
        {"user", required_argument, 0, 0},
        {"log_level", required_argument, 0, 0},
        {"wait_ms", required_argument, 0, 0},
        {"help", no_argument, 0, 0},
        {0, 0, 0, 0}
    };

    int option_index = 0;
    int c;
    // Suppress getopt_long default error messages for unknown options
    opterr = 0;
    // Reset getopt state in case other parsers were used earlier
    optind = 1;

    while ((c = getopt_long(argc, argv, "y:w:r:c:f:", long_options, &option_index)) != -1) {
        try {
            switch (c) {
                case 'y':
                    config_.sync.typing_validity_seconds.set(std::stoi(optarg));
                    break;
                case 'w':
                    config_.sync.status_online_window_seconds.set(std::stoi(optarg));
                    break;
                case 'r':
                    config_.sync.replay_buffer_size.set(std::stoull(optarg));
                    break;
                case 'c':
                    config_.subscriptions.collect_timeout_ms.set(std::stoi(optarg));
                    break;
                case 'f':
                    if (!loadFromFile(optarg)) {
                        LOG(ERROR) << "Configuration file " << optarg << " rejected, keeping previous values";
                    }
                    break;
                default:
                    // Ignore flags handled elsewhere
                    break;
            }
        } catch (const std::exception& e) {
            LOG(WARNING) << "Ignoring malformed command line value '" << optarg << "': " << e.what();
        }
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.sync.typing_validity_seconds.get() < 1) {
        validation_errors_.push_back("Typing validity window must be at least 1 second");
    }

    if (config_.sync.status_online_window_seconds.get() < 0) {
        validation_errors_.push_back("Status online window cannot be negative");
    }

    if (config_.sync.replay_buffer_size.get() < 1) {
        validation_errors_.push_back("Replay buffer size must be at least 1");
    }

    if (config_.subscriptions.collect_timeout_ms.get() < 0) {
        validation_errors_.push_back("Collect timeout cannot be negative");
    }

    const std::string policies[] = {
        config_.subscriptions.project_cache_policy.get(),
        config_.subscriptions.status_cache_policy.get(),
        config_.subscriptions.content_cache_policy.get(),
        config_.subscriptions.typing_cache_policy.get(),
    };
    for (const auto& policy : policies) {
        if (!ParseCachePolicy(policy).has_value()) {
            validation_errors_.push_back("Unknown cache policy: " + policy);
        }
    }

    if (config_.transport.relays.empty()) {
        validation_errors_.push_back("At least one relay must be configured");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

bool Configuration::validateConfig() {
    bool ok = validate();
    for (const auto& error : validation_errors_) {
        LOG(ERROR) << "Invalid configuration: " << error;
    }
    return ok;
}

} // namespace Estuary
