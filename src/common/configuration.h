#ifndef TIDEWATER_CONFIGURATION_H_
#define TIDEWATER_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace YAML {
class Node;
}

namespace Tidewater {

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

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

/**
 * A stream created in the in-memory store when the controller starts
 */
struct StreamBootstrap {
    std::string scope;
    std::string name;
    int num_segments = 1;
};

/**
 * Main configuration structure
 */
struct ControllerConfig {
    struct Controller {
        ConfigValue<int> worker_threads{4, "TIDEWATER_WORKER_THREADS"};
        ConfigValue<size_t> request_queue_capacity{1024, "TIDEWATER_REQUEST_QUEUE_CAPACITY"};
    } controller;

    // Dispatcher retry policy. max_attempts == 0 retries forever.
    struct RequestProcessor {
        ConfigValue<int> initial_backoff_ms{100, "TIDEWATER_INITIAL_BACKOFF_MS"};
        ConfigValue<int> max_backoff_ms{10000, "TIDEWATER_MAX_BACKOFF_MS"};
        ConfigValue<int> max_attempts{0, "TIDEWATER_MAX_ATTEMPTS"};
    } request_processor;

    struct SegmentStore {
        ConfigValue<std::string> address{"127.0.0.1:12345", "TIDEWATER_SEGMENT_STORE_ADDRESS"};
        ConfigValue<int> connect_timeout_ms{2000, "TIDEWATER_SEGMENT_STORE_CONNECT_TIMEOUT"};
    } segment_store;

    struct Auth {
        ConfigValue<bool> enabled{false, "TIDEWATER_AUTH_ENABLED"};
        ConfigValue<std::string> token{"", "TIDEWATER_AUTH_TOKEN"};
    } auth;

    struct Bootstrap {
        std::vector<StreamBootstrap> streams;
    } bootstrap;
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

    // Drop everything loaded so far
    void resetToDefaults() { config_ = ControllerConfig(); }

    // Get the configuration
    const ControllerConfig& config() const { return config_; }
    ControllerConfig& config() { return config_; }

    // Helper methods for common access patterns
    int getWorkerThreads() const { return config_.controller.worker_threads.get(); }
    size_t getRequestQueueCapacity() const { return config_.controller.request_queue_capacity.get(); }
    std::string getSegmentStoreAddress() const { return config_.segment_store.address.get(); }
    const std::vector<StreamBootstrap>& getBootstrapStreams() const {
        return config_.bootstrap.streams;
    }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    ControllerConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void parseRoot(const YAML::Node& yaml);
};

} // namespace Tidewater

#endif // TIDEWATER_CONFIGURATION_H_
