#ifndef FTSB_CONFIGURATION_H_
#define FTSB_CONFIGURATION_H_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "config.h"

namespace cxxopts {
class Options;
class ParseResult;
}  // namespace cxxopts

namespace YAML {
class Node;
}  // namespace YAML

namespace Ftsb {

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
 * Every knob of a benchmark run. Built once in main() and handed to the
 * runner by reference; nothing reads it through a global.
 */
struct BenchmarkConfig {
    // Target system
    struct Target {
        ConfigValue<std::string> host{"localhost:6379", "FTSB_HOST"};
        ConfigValue<int> connections{1, "FTSB_CONNECTIONS"};
        ConfigValue<bool> cluster_mode{false, "FTSB_CLUSTER_MODE"};
        ConfigValue<std::string> index{"idx1", "FTSB_INDEX"};
        // Arguments appended to FT.CREATE <index> when the database is created
        ConfigValue<std::string> index_schema{"", "FTSB_INDEX_SCHEMA"};
    } target;

    // Load generation
    struct Load {
        ConfigValue<int> workers{8, "FTSB_WORKERS"};
        ConfigValue<int> work_queues{kWorkerPerQueue, "FTSB_WORK_QUEUES"};
        ConfigValue<size_t> batch_size{kDefaultBatchSize, "FTSB_BATCH_SIZE"};
        ConfigValue<size_t> pipeline{kDefaultPipeline, "FTSB_PIPELINE"};
        // 0 = read everything
        ConfigValue<size_t> limit{0, "FTSB_LIMIT"};
        // Empty = standard input
        ConfigValue<std::string> file{"", "FTSB_FILE"};
        ConfigValue<bool> do_load{true, "FTSB_DO_BENCHMARK"};
        ConfigValue<bool> continue_on_error{false, "FTSB_CONTINUE_ON_ERROR"};
        // Off by default so rx totals stay comparable with older result files
        ConfigValue<bool> measure_rx_bytes{false, "FTSB_MEASURE_RX_BYTES"};
    } load;

    // Database lifecycle
    struct Database {
        ConfigValue<bool> do_create_db{true, "FTSB_DO_CREATE_DB"};
        ConfigValue<bool> do_abort_on_exist{false, "FTSB_DO_ABORT_ON_EXIST"};
    } database;

    // Reporting and results
    struct Report {
        ConfigValue<std::string> reporting_period{"1s", "FTSB_REPORTING_PERIOD"};
        ConfigValue<std::string> json_out_file{"", "FTSB_JSON_OUT_FILE"};
        ConfigValue<std::string> metadata{"", "FTSB_METADATA"};
        ConfigValue<int> debug{0, "FTSB_DEBUG"};
    } report;
};

/**
 * Configuration manager. Layers, lowest precedence first: built-in
 * defaults, YAML file (root key "ftsb"), command line, FTSB_* environment.
 */
class Configuration {
public:
    Configuration() = default;

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Registers every command line option understood by overrideFromCommandLine
    static void addCommandLineOptions(cxxopts::Options& options);

    // Override with command line arguments; loads --config first when present
    bool overrideFromCommandLine(const cxxopts::ParseResult& result);

    // Get the configuration
    const BenchmarkConfig& config() const { return config_; }
    BenchmarkConfig& config() { return config_; }

    // Helper methods for common access patterns
    size_t getBatchSize() const { return config_.load.batch_size.get(); }
    int getWorkers() const { return config_.load.workers.get(); }
    std::chrono::nanoseconds getReportingPeriod() const;

    // Number of work queues actually created (resolves the per-worker mode)
    unsigned getWorkQueueCount() const;

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    BenchmarkConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void parseRoot(const YAML::Node& root);
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

} // namespace Ftsb

#endif // FTSB_CONFIGURATION_H_
