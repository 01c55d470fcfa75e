#include <iostream>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "common/configuration.h"
#include "load/benchmark_runner.h"
#include "redis/redisearch_benchmark.h"

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files.

    cxxopts::Options options("ftsb_redisearch",
        "Replays pre-generated RediSearch command records and measures latency and throughput");
    Ftsb::Configuration::addCommandLineOptions(options);

    Ftsb::Configuration configuration;
    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }
        if (!configuration.overrideFromCommandLine(result)) {
            for (const auto& error : configuration.getValidationErrors()) {
                LOG(ERROR) << "Invalid configuration: " << error;
            }
            return 1;
        }
    } catch (const std::exception& e) {
        LOG(ERROR) << "Error parsing options: " << e.what();
        return 1;
    }

    FLAGS_v = configuration.config().report.debug.get();

    Ftsb::RediSearchBenchmark benchmark(configuration);
    Ftsb::BenchmarkRunner runner(configuration, std::cerr, std::cout);
    runner.Run(benchmark);
    return 0;
}
