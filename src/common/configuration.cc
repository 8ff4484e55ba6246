#include "configuration.h"
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>
#include "absl/strings/numbers.h"

namespace Tidewater {

namespace {

// Raw value of a TIDEWATER_* variable, if it is set
std::optional<std::string> lookupEnv(const std::string& name) {
    const char* raw = std::getenv(name.c_str());
    if (raw == nullptr) {
        return std::nullopt;
    }
    return std::string(raw);
}

// Unparsable overrides are logged and ignored
template<typename T>
std::optional<T> rejectOverride(const std::string& name, const std::string& raw) {
    LOG(WARNING) << "Ignoring " << name << "='" << raw << "', keeping the configured value";
    return std::nullopt;
}

} // namespace

template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    auto raw = lookupEnv(env_var_);
    if (!raw) return std::nullopt;
    int parsed;
    if (absl::SimpleAtoi(*raw, &parsed)) return parsed;
    return rejectOverride<int>(env_var_, *raw);
}

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    auto raw = lookupEnv(env_var_);
    if (!raw) return std::nullopt;
    uint64_t parsed;
    if (absl::SimpleAtoi(*raw, &parsed)) return static_cast<size_t>(parsed);
    return rejectOverride<size_t>(env_var_, *raw);
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    return lookupEnv(env_var_);
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    auto raw = lookupEnv(env_var_);
    if (!raw) return std::nullopt;
    // Accepts true/false, yes/no, t/f, y/n and 1/0 in any case
    bool parsed;
    if (absl::SimpleAtob(*raw, &parsed)) return parsed;
    return rejectOverride<bool>(env_var_, *raw);
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::parseRoot(const YAML::Node& yaml) {
    if (!yaml["tidewater"]) {
        LOG(WARNING) << "Configuration has no 'tidewater' section, keeping defaults";
        return;
    }
    auto root = yaml["tidewater"];

    // Controller
    if (root["controller"]) {
        auto controller = root["controller"];
        if (controller["worker_threads"]) config_.controller.worker_threads.set(controller["worker_threads"].as<int>());
        if (controller["request_queue_capacity"]) config_.controller.request_queue_capacity.set(controller["request_queue_capacity"].as<size_t>());
    }

    // Request processor
    if (root["request_processor"]) {
        auto processor = root["request_processor"];
        if (processor["initial_backoff_ms"]) config_.request_processor.initial_backoff_ms.set(processor["initial_backoff_ms"].as<int>());
        if (processor["max_backoff_ms"]) config_.request_processor.max_backoff_ms.set(processor["max_backoff_ms"].as<int>());
        if (processor["max_attempts"]) config_.request_processor.max_attempts.set(processor["max_attempts"].as<int>());
    }

    // Segment store
    if (root["segment_store"]) {
        auto segment_store = root["segment_store"];
        if (segment_store["address"]) config_.segment_store.address.set(segment_store["address"].as<std::string>());
        if (segment_store["connect_timeout_ms"]) config_.segment_store.connect_timeout_ms.set(segment_store["connect_timeout_ms"].as<int>());
    }

    // Auth
    if (root["auth"]) {
        auto auth = root["auth"];
        if (auth["enabled"]) config_.auth.enabled.set(auth["enabled"].as<bool>());
        if (auth["token"]) config_.auth.token.set(auth["token"].as<std::string>());
    }

    // Streams created at startup
    if (root["bootstrap"] && root["bootstrap"]["streams"]) {
        config_.bootstrap.streams.clear();
        for (const auto& node : root["bootstrap"]["streams"]) {
            StreamBootstrap stream;
            stream.scope = node["scope"].as<std::string>();
            stream.name = node["name"].as<std::string>();
            if (node["segments"]) stream.num_segments = node["segments"].as<int>();
            config_.bootstrap.streams.push_back(stream);
        }
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        parseRoot(YAML::LoadFile(filename));
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        parseRoot(YAML::Load(yaml_content));
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.controller.worker_threads.get() < 1) {
        validation_errors_.push_back("Worker threads must be at least 1");
    }

    // folly::MPMCQueue rejects a zero capacity
    if (config_.controller.request_queue_capacity.get() < 1) {
        validation_errors_.push_back("Request queue capacity must be at least 1");
    }

    const auto& processor = config_.request_processor;
    if (processor.initial_backoff_ms.get() < 0) {
        validation_errors_.push_back("Initial backoff cannot be negative");
    }
    if (processor.max_backoff_ms.get() < processor.initial_backoff_ms.get()) {
        validation_errors_.push_back("Max backoff cannot be smaller than initial backoff");
    }
    if (processor.max_attempts.get() < 0) {
        validation_errors_.push_back("Max attempts cannot be negative (0 means unbounded)");
    }

    if (config_.segment_store.address.get().find(':') == std::string::npos) {
        validation_errors_.push_back("Segment store address must be host:port");
    }

    if (config_.auth.enabled.get() && config_.auth.token.get().empty()) {
        validation_errors_.push_back("Auth is enabled but no token is configured");
    }

    for (const auto& stream : config_.bootstrap.streams) {
        if (stream.scope.empty() || stream.name.empty()) {
            validation_errors_.push_back("Bootstrap stream needs both scope and name");
        }
        if (stream.num_segments < 1) {
            validation_errors_.push_back("Bootstrap stream " + stream.scope + "/" + stream.name +
                                         " needs at least one segment");
        }
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Tidewater
