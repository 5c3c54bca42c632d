#ifndef KVLOAD_CONFIGURATION_H_
#define KVLOAD_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace YAML {
class Node;
}

namespace KvLoad {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    // Precedence: explicit override, then environment, then value.
    T get() const {
        if (override_.has_value()) {
            return override_.value();
        }
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    // Command line values; win over the environment.
    void setOverride(T value) { override_ = value; }
    void clearOverride() { override_.reset(); }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;
    std::optional<T> override_;

    std::optional<T> getEnvValue() const;
};

// Upper bound for the averaged generation parameters so that 2 * avg_columns
// and avg_data_size * 3 / 2 fit the generator bounds.
constexpr int64_t kMaxGenerationAverage = INT32_MAX / 2;

/**
 * Main configuration structure
 */
struct KvLoadConfig {
    // Key range and destination table
    struct Workload {
        ConfigValue<int64_t> start_key{0, "KVLOAD_START_KEY"};
        ConfigValue<int64_t> num_keys{0, "KVLOAD_NUM_KEYS"};
        ConfigValue<std::string> table_name{"cluster_test", "KVLOAD_TABLE_NAME"};
        ConfigValue<std::string> column_family{"test_cf", "KVLOAD_COLUMN_FAMILY"};
    } workload;

    struct Writer {
        ConfigValue<bool> enabled{false, "KVLOAD_WRITE"};
        ConfigValue<int> threads{20, "KVLOAD_WRITER_THREADS"};
        // Columns per key are drawn from [1, 2 * avg_columns].
        ConfigValue<int> avg_columns{5, "KVLOAD_AVG_COLUMNS"};
        // Column sizes are drawn from [avg / 2, avg * 3 / 2].
        ConfigValue<size_t> avg_data_size{256, "KVLOAD_AVG_DATA_SIZE"};
        ConfigValue<bool> multi_put{false, "KVLOAD_MULTIPUT"};
        // Negative: never stop on write errors.
        ConfigValue<int> max_write_errors{-1, "KVLOAD_MAX_WRITE_ERRORS"};
    } writer;

    struct Reader {
        ConfigValue<bool> enabled{false, "KVLOAD_READ"};
        ConfigValue<int> threads{20, "KVLOAD_READER_THREADS"};
        ConfigValue<int> verify_percent{100, "KVLOAD_VERIFY_PERCENT"};
        ConfigValue<int> max_read_errors{10, "KVLOAD_MAX_READ_ERRORS"};
        ConfigValue<int> key_window{0, "KVLOAD_KEY_WINDOW"};
        ConfigValue<size_t> seed{0, "KVLOAD_READER_SEED"};
    } reader;

    // How readers poll a linked writer's watermark
    struct Coordination {
        ConfigValue<int> min_backoff_ms{1, "KVLOAD_MIN_BACKOFF_MS"};
        ConfigValue<int> max_backoff_ms{100, "KVLOAD_MAX_BACKOFF_MS"};
    } coordination;

    struct Reporting {
        // 0 disables periodic progress reports.
        ConfigValue<int> progress_interval_ms{5000, "KVLOAD_PROGRESS_INTERVAL_MS"};
    } reporting;

    // In-memory reference store used by the command line tool
    struct Store {
        ConfigValue<size_t> num_shards{16, "KVLOAD_STORE_SHARDS"};
        ConfigValue<int> max_op_delay_us{0, "KVLOAD_STORE_MAX_DELAY_US"};
    } store;
};

/**
 * Configuration manager. The tool uses the process-wide instance; tests may
 * build their own.
 */
class Configuration {
public:
    Configuration() = default;

    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const KvLoadConfig& config() const { return config_; }
    KvLoadConfig& config() { return config_; }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    KvLoadConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& yaml);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace KvLoad

#endif // KVLOAD_CONFIGURATION_H_
