#include <gtest/gtest.h>
#include "../../src/common/configuration.h"

#include <cstdlib>
#include <fstream>

#include <cxxopts.hpp>

using namespace Ftsb;
using namespace std::chrono_literals;

class ConfigurationTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("FTSB_WORKERS");
        unsetenv("FTSB_HOST");
        unsetenv("FTSB_CONTINUE_ON_ERROR");
    }

    // Parses argv the way main() does
    bool ParseArgs(std::vector<std::string> args) {
        cxxopts::Options options("ftsb_test");
        Configuration::addCommandLineOptions(options);
        std::vector<char*> argv;
        argv.push_back(const_cast<char*>("ftsb_test"));
        for (auto& arg : args) {
            argv.push_back(&arg[0]);
        }
        auto result = options.parse(static_cast<int>(argv.size()), argv.data());
        return config_.overrideFromCommandLine(result);
    }

    Configuration config_;
};

TEST_F(ConfigurationTest, Defaults) {
    const auto& c = config_.config();
    EXPECT_EQ(c.target.host.get(), "localhost:6379");
    EXPECT_EQ(c.target.index.get(), "idx1");
    EXPECT_EQ(config_.getWorkers(), 8);
    EXPECT_EQ(config_.getBatchSize(), 1000u);
    EXPECT_EQ(c.load.pipeline.get(), 50u);
    EXPECT_EQ(c.load.limit.get(), 0u);
    EXPECT_TRUE(c.load.do_load.get());
    EXPECT_FALSE(c.load.continue_on_error.get());
    EXPECT_FALSE(c.load.measure_rx_bytes.get());
    EXPECT_TRUE(c.database.do_create_db.get());
    EXPECT_FALSE(c.database.do_abort_on_exist.get());
    EXPECT_EQ(config_.getReportingPeriod(), 1s);
    EXPECT_EQ(config_.getWorkQueueCount(), 8u);
    EXPECT_TRUE(config_.validate());
}

TEST_F(ConfigurationTest, LoadFromYaml) {
    const char* yaml = R"(
ftsb:
  target:
    host: "redis-1:7000"
    cluster_mode: true
    index: products
  load:
    workers: 4
    work_queues: 2
    batch_size: 100
    pipeline: 10
    do_benchmark: false
  report:
    reporting_period: 500ms
    json_out_file: results.json
)";
    ASSERT_TRUE(config_.loadFromString(yaml));
    const auto& c = config_.config();
    EXPECT_EQ(c.target.host.get(), "redis-1:7000");
    EXPECT_TRUE(c.target.cluster_mode.get());
    EXPECT_EQ(c.target.index.get(), "products");
    EXPECT_EQ(config_.getWorkers(), 4);
    EXPECT_EQ(config_.getWorkQueueCount(), 2u);
    EXPECT_EQ(config_.getBatchSize(), 100u);
    EXPECT_EQ(c.load.pipeline.get(), 10u);
    EXPECT_FALSE(c.load.do_load.get());
    EXPECT_EQ(config_.getReportingPeriod(), 500ms);
    EXPECT_EQ(c.report.json_out_file.get(), "results.json");
}

TEST_F(ConfigurationTest, MalformedYamlFails) {
    EXPECT_FALSE(config_.loadFromString("ftsb: [unbalanced"));
}

TEST_F(ConfigurationTest, CommandLineOverridesFile) {
    const std::string path = ::testing::TempDir() + "ftsb_config_test.yaml";
    {
        std::ofstream file(path);
        file << "ftsb:\n  load:\n    workers: 2\n    pipeline: 7\n";
    }
    ASSERT_TRUE(ParseArgs({"--config", path, "--workers", "6", "--continue-on-error=true"}));
    EXPECT_EQ(config_.getWorkers(), 6);
    EXPECT_EQ(config_.config().load.pipeline.get(), 7u);
    EXPECT_TRUE(config_.config().load.continue_on_error.get());
}

TEST_F(ConfigurationTest, EnvironmentOverridesEverything) {
    ASSERT_TRUE(ParseArgs({"--workers", "6", "--host", "cli:1"}));
    setenv("FTSB_WORKERS", "3", 1);
    setenv("FTSB_HOST", "env:2", 1);
    setenv("FTSB_CONTINUE_ON_ERROR", "yes", 1);
    EXPECT_EQ(config_.getWorkers(), 3);
    EXPECT_EQ(config_.config().target.host.get(), "env:2");
    EXPECT_TRUE(config_.config().load.continue_on_error.get());
}

TEST_F(ConfigurationTest, InvalidEnvironmentValueIsIgnored) {
    setenv("FTSB_WORKERS", "many", 1);
    EXPECT_EQ(config_.getWorkers(), 8);
}

TEST_F(ConfigurationTest, ValidationCollectsErrors) {
    auto& c = config_.config();
    c.load.workers.set(2);
    c.load.work_queues.set(3);
    c.load.batch_size.set(0);
    c.report.reporting_period.set("soon");

    EXPECT_FALSE(config_.validate());
    auto errors = config_.getValidationErrors();
    EXPECT_EQ(errors.size(), 3u);
}

TEST_F(ConfigurationTest, ZeroReportingPeriodIsValid) {
    config_.config().report.reporting_period.set("0");
    EXPECT_TRUE(config_.validate());
    EXPECT_EQ(config_.getReportingPeriod().count(), 0);
}
