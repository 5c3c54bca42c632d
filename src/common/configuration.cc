#include "configuration.h"
#include <algorithm>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace KvLoad {

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
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return static_cast<int64_t>(std::stoll(env_val));
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

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        applyYAML(YAML::LoadFile(filename));
        LOG(INFO) << "Loaded configuration from " << filename;
        return true;
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        applyYAML(YAML::Load(yaml_content));
        return true;
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["kvload"]) {
        LOG(WARNING) << "Configuration has no top-level 'kvload' section, nothing applied";
        return;
    }
    auto root = yaml["kvload"];

    // Workload
    if (root["workload"]) {
        auto workload = root["workload"];
        if (workload["start_key"]) config_.workload.start_key.set(workload["start_key"].as<int64_t>());
        if (workload["num_keys"]) config_.workload.num_keys.set(workload["num_keys"].as<int64_t>());
        if (workload["table_name"]) config_.workload.table_name.set(workload["table_name"].as<std::string>());
        if (workload["column_family"]) config_.workload.column_family.set(workload["column_family"].as<std::string>());
    }

    // Writer
    if (root["writer"]) {
        auto writer = root["writer"];
        if (writer["enabled"]) config_.writer.enabled.set(writer["enabled"].as<bool>());
        if (writer["threads"]) config_.writer.threads.set(writer["threads"].as<int>());
        if (writer["avg_columns"]) config_.writer.avg_columns.set(writer["avg_columns"].as<int>());
        if (writer["avg_data_size"]) config_.writer.avg_data_size.set(writer["avg_data_size"].as<size_t>());
        if (writer["multi_put"]) config_.writer.multi_put.set(writer["multi_put"].as<bool>());
        if (writer["max_write_errors"]) config_.writer.max_write_errors.set(writer["max_write_errors"].as<int>());
    }

    // Reader
    if (root["reader"]) {
        auto reader = root["reader"];
        if (reader["enabled"]) config_.reader.enabled.set(reader["enabled"].as<bool>());
        if (reader["threads"]) config_.reader.threads.set(reader["threads"].as<int>());
        if (reader["verify_percent"]) config_.reader.verify_percent.set(reader["verify_percent"].as<int>());
        if (reader["max_read_errors"]) config_.reader.max_read_errors.set(reader["max_read_errors"].as<int>());
        if (reader["key_window"]) config_.reader.key_window.set(reader["key_window"].as<int>());
        if (reader["seed"]) config_.reader.seed.set(reader["seed"].as<size_t>());
    }

    // Coordination
    if (root["coordination"]) {
        auto coordination = root["coordination"];
        if (coordination["min_backoff_ms"]) config_.coordination.min_backoff_ms.set(coordination["min_backoff_ms"].as<int>());
        if (coordination["max_backoff_ms"]) config_.coordination.max_backoff_ms.set(coordination["max_backoff_ms"].as<int>());
    }

    // Reporting
    if (root["reporting"]) {
        auto reporting = root["reporting"];
        if (reporting["progress_interval_ms"]) config_.reporting.progress_interval_ms.set(reporting["progress_interval_ms"].as<int>());
    }

    // Store
    if (root["store"]) {
        auto store = root["store"];
        if (store["num_shards"]) config_.store.num_shards.set(store["num_shards"].as<size_t>());
        if (store["max_op_delay_us"]) config_.store.max_op_delay_us.set(store["max_op_delay_us"].as<int>());
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    // Validate the key range
    if (config_.workload.start_key.get() < 0) {
        validation_errors_.push_back("Start key must not be negative");
    }
    if (config_.workload.num_keys.get() < 1) {
        validation_errors_.push_back("Number of keys must be at least 1");
    } else if (config_.workload.num_keys.get() > INT64_MAX - std::max<int64_t>(0, config_.workload.start_key.get())) {
        validation_errors_.push_back("Key range overflows a 64-bit key");
    }

    if (!config_.writer.enabled.get() && !config_.reader.enabled.get()) {
        validation_errors_.push_back("Either write or read has to be enabled");
    }

    // Validate thread counts
    if (config_.writer.threads.get() < 1 || config_.writer.threads.get() > 32767) {
        validation_errors_.push_back("Writer threads must be between 1 and 32767");
    }
    if (config_.reader.threads.get() < 1 || config_.reader.threads.get() > 32767) {
        validation_errors_.push_back("Reader threads must be between 1 and 32767");
    }

    // Validate generation parameters
    if (config_.writer.avg_columns.get() < 1 || config_.writer.avg_columns.get() > kMaxGenerationAverage) {
        validation_errors_.push_back("Average columns per key must be between 1 and " +
                                     std::to_string(kMaxGenerationAverage));
    }
    if (config_.writer.avg_data_size.get() < 1 ||
        config_.writer.avg_data_size.get() > static_cast<size_t>(kMaxGenerationAverage)) {
        validation_errors_.push_back("Average column data size must be between 1 and " +
                                     std::to_string(kMaxGenerationAverage));
    }

    // Validate verification settings
    if (config_.reader.verify_percent.get() < 0 || config_.reader.verify_percent.get() > 100) {
        validation_errors_.push_back("Verify percent must be between 0 and 100");
    }
    if (config_.reader.max_read_errors.get() < 0) {
        validation_errors_.push_back("Max read errors must not be negative");
    }
    if (config_.reader.key_window.get() < 0) {
        validation_errors_.push_back("Key window must not be negative");
    }

    if (config_.coordination.min_backoff_ms.get() < 1 ||
        config_.coordination.max_backoff_ms.get() < config_.coordination.min_backoff_ms.get()) {
        validation_errors_.push_back("Backoff must satisfy 1 <= min_backoff_ms <= max_backoff_ms");
    }
    if (config_.reporting.progress_interval_ms.get() < 0) {
        validation_errors_.push_back("Progress interval must not be negative");
    }
    if (config_.store.num_shards.get() < 1) {
        validation_errors_.push_back("Store shards must be at least 1");
    }
    if (config_.store.max_op_delay_us.get() < 0) {
        validation_errors_.push_back("Store delay must not be negative");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace KvLoad
