#include "configuration.h"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

#include <cxxopts.hpp>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "units.h"

namespace Ftsb {

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

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        if (yaml["ftsb"]) {
            parseRoot(yaml["ftsb"]);
        } else {
            LOG(WARNING) << "Configuration file " << filename << " has no \"ftsb\" section";
        }
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file: " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        if (yaml["ftsb"]) {
            parseRoot(yaml["ftsb"]);
        }
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::parseRoot(const YAML::Node& root) {
    // Target
    if (root["target"]) {
        auto target = root["target"];
        if (target["host"]) config_.target.host.set(target["host"].as<std::string>());
        if (target["connections"]) config_.target.connections.set(target["connections"].as<int>());
        if (target["cluster_mode"]) config_.target.cluster_mode.set(target["cluster_mode"].as<bool>());
        if (target["index"]) config_.target.index.set(target["index"].as<std::string>());
        if (target["index_schema"]) config_.target.index_schema.set(target["index_schema"].as<std::string>());
    }

    // Load
    if (root["load"]) {
        auto load = root["load"];
        if (load["workers"]) config_.load.workers.set(load["workers"].as<int>());
        if (load["work_queues"]) config_.load.work_queues.set(load["work_queues"].as<int>());
        if (load["batch_size"]) config_.load.batch_size.set(load["batch_size"].as<size_t>());
        if (load["pipeline"]) config_.load.pipeline.set(load["pipeline"].as<size_t>());
        if (load["limit"]) config_.load.limit.set(load["limit"].as<size_t>());
        if (load["file"]) config_.load.file.set(load["file"].as<std::string>());
        if (load["do_benchmark"]) config_.load.do_load.set(load["do_benchmark"].as<bool>());
        if (load["continue_on_error"]) config_.load.continue_on_error.set(load["continue_on_error"].as<bool>());
        if (load["measure_rx_bytes"]) config_.load.measure_rx_bytes.set(load["measure_rx_bytes"].as<bool>());
    }

    // Database
    if (root["database"]) {
        auto database = root["database"];
        if (database["do_create_db"]) config_.database.do_create_db.set(database["do_create_db"].as<bool>());
        if (database["do_abort_on_exist"]) config_.database.do_abort_on_exist.set(database["do_abort_on_exist"].as<bool>());
    }

    // Report
    if (root["report"]) {
        auto report = root["report"];
        if (report["reporting_period"]) config_.report.reporting_period.set(report["reporting_period"].as<std::string>());
        if (report["json_out_file"]) config_.report.json_out_file.set(report["json_out_file"].as<std::string>());
        if (report["metadata"]) config_.report.metadata.set(report["metadata"].as<std::string>());
        if (report["debug"]) config_.report.debug.set(report["debug"].as<int>());
    }
}

void Configuration::addCommandLineOptions(cxxopts::Options& options) {
    options.add_options()
        ("config", "YAML configuration file (root key \"ftsb\")", cxxopts::value<std::string>())
        ("host", "The host:port for the Redis connection", cxxopts::value<std::string>()->default_value("localhost:6379"))
        ("connections", "Connections per worker", cxxopts::value<int>()->default_value("1"))
        ("cluster-mode", "Run client in cluster mode", cxxopts::value<bool>()->default_value("false"))
        ("index", "Name of index", cxxopts::value<std::string>()->default_value("idx1"))
        ("index-schema", "Arguments appended to FT.CREATE <index> when creating the index",
            cxxopts::value<std::string>()->default_value(""))
        ("workers", "Number of parallel clients inserting", cxxopts::value<int>()->default_value("8"))
        ("work-queues", "Number of work queues (0 = one per worker)", cxxopts::value<int>()->default_value("0"))
        ("batch-size", "Number of items to batch together in a single insert", cxxopts::value<size_t>()->default_value("1000"))
        ("pipeline", "The pipeline's size", cxxopts::value<size_t>()->default_value("50"))
        ("limit", "Number of items to insert (0 = all of them)", cxxopts::value<size_t>()->default_value("0"))
        ("file", "File name to read data from (empty = stdin)", cxxopts::value<std::string>()->default_value(""))
        ("do-benchmark", "Whether to send commands. Set to false to check input read speed",
            cxxopts::value<bool>()->default_value("true"))
        ("do-create-db", "Whether to create the database. Disable on all but one client when running multiple clients",
            cxxopts::value<bool>()->default_value("true"))
        ("do-abort-on-exist", "Whether to abort if a database with the given name already exists",
            cxxopts::value<bool>()->default_value("false"))
        ("continue-on-error", "If set to true, continue on dispatch errors", cxxopts::value<bool>()->default_value("false"))
        ("measure-rx-bytes", "Account reply payload sizes as received bytes", cxxopts::value<bool>()->default_value("false"))
        ("reporting-period", "Period to report stats (0 disables)", cxxopts::value<std::string>()->default_value("1s"))
        ("json-out-file", "Name of json output file to output benchmark results", cxxopts::value<std::string>()->default_value(""))
        ("metadata-string", "Metadata string to add to json-out-file", cxxopts::value<std::string>()->default_value(""))
        ("debug", "Debug verbosity", cxxopts::value<int>()->default_value("0"))
        ("h,help", "Print usage");
}

bool Configuration::overrideFromCommandLine(const cxxopts::ParseResult& result) {
    if (result.count("config")) {
        if (!loadFromFile(result["config"].as<std::string>())) {
            return false;
        }
    }

    if (result.count("host")) config_.target.host.set(result["host"].as<std::string>());
    if (result.count("connections")) config_.target.connections.set(result["connections"].as<int>());
    if (result.count("cluster-mode")) config_.target.cluster_mode.set(result["cluster-mode"].as<bool>());
    if (result.count("index")) config_.target.index.set(result["index"].as<std::string>());
    if (result.count("index-schema")) config_.target.index_schema.set(result["index-schema"].as<std::string>());

    if (result.count("workers")) config_.load.workers.set(result["workers"].as<int>());
    if (result.count("work-queues")) config_.load.work_queues.set(result["work-queues"].as<int>());
    if (result.count("batch-size")) config_.load.batch_size.set(result["batch-size"].as<size_t>());
    if (result.count("pipeline")) config_.load.pipeline.set(result["pipeline"].as<size_t>());
    if (result.count("limit")) config_.load.limit.set(result["limit"].as<size_t>());
    if (result.count("file")) config_.load.file.set(result["file"].as<std::string>());
    if (result.count("do-benchmark")) config_.load.do_load.set(result["do-benchmark"].as<bool>());
    if (result.count("continue-on-error")) config_.load.continue_on_error.set(result["continue-on-error"].as<bool>());
    if (result.count("measure-rx-bytes")) config_.load.measure_rx_bytes.set(result["measure-rx-bytes"].as<bool>());

    if (result.count("do-create-db")) config_.database.do_create_db.set(result["do-create-db"].as<bool>());
    if (result.count("do-abort-on-exist")) config_.database.do_abort_on_exist.set(result["do-abort-on-exist"].as<bool>());

    if (result.count("reporting-period")) config_.report.reporting_period.set(result["reporting-period"].as<std::string>());
    if (result.count("json-out-file")) config_.report.json_out_file.set(result["json-out-file"].as<std::string>());
    if (result.count("metadata-string")) config_.report.metadata.set(result["metadata-string"].as<std::string>());
    if (result.count("debug")) config_.report.debug.set(result["debug"].as<int>());

    return validate();
}

std::chrono::nanoseconds Configuration::getReportingPeriod() const {
    return ParseDuration(config_.report.reporting_period.get());
}

unsigned Configuration::getWorkQueueCount() const {
    int queues = config_.load.work_queues.get();
    if (queues <= kWorkerPerQueue) {
        return static_cast<unsigned>(config_.load.workers.get());
    }
    return static_cast<unsigned>(queues);
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.load.workers.get() < 1) {
        validation_errors_.push_back("Workers must be at least 1");
    }

    if (config_.load.work_queues.get() < 0) {
        validation_errors_.push_back("Work queues cannot be negative");
    } else if (config_.load.work_queues.get() > config_.load.workers.get()) {
        validation_errors_.push_back("Cannot have more work queues (" +
            std::to_string(config_.load.work_queues.get()) + ") than workers (" +
            std::to_string(config_.load.workers.get()) + ")");
    }

    if (config_.load.batch_size.get() < 1) {
        validation_errors_.push_back("Batch size must be at least 1");
    }

    if (config_.load.pipeline.get() < 1) {
        validation_errors_.push_back("Pipeline must be at least 1");
    }

    if (config_.target.connections.get() < 1) {
        validation_errors_.push_back("Connections must be at least 1");
    }

    if (config_.target.host.get().empty()) {
        validation_errors_.push_back("Host cannot be empty");
    }

    try {
        if (getReportingPeriod().count() < 0) {
            validation_errors_.push_back("Reporting period cannot be negative");
        }
    } catch (const std::logic_error& e) {
        validation_errors_.push_back(std::string("Reporting period: ") + e.what());
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Ftsb
