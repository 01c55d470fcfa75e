#include "redisearch_benchmark.h"

#include <algorithm>

namespace Ftsb {

namespace {

RediSearchOptions OptionsFrom(const Configuration& config) {
	const BenchmarkConfig& c = config.config();
	RediSearchOptions options;
	options.host = c.target.host.get();
	options.connections = static_cast<size_t>(std::max(c.target.connections.get(), 1));
	options.cluster_mode = c.target.cluster_mode.get();
	options.pipeline = c.load.pipeline.get();
	options.continue_on_error = c.load.continue_on_error.get();
	options.measure_rx_bytes = c.load.measure_rx_bytes.get();
	return options;
}

}  // namespace

RediSearchBenchmark::RediSearchBenchmark(const Configuration& config, PipelineClientFactory factory)
	: options_(OptionsFrom(config)),
	  factory_(std::move(factory)),
	  db_creator_(options_.host, config.config().target.index_schema.get()),
	  index_schema_(config.config().target.index_schema.get()) {}

std::unique_ptr<RecordDecoder> RediSearchBenchmark::GetCmdDecoder(std::istream& in) {
	return std::make_unique<CsvRecordDecoder>(in);
}

std::unique_ptr<RecordIndexer> RediSearchBenchmark::GetCommandIndexer(unsigned max_partitions) {
	return std::make_unique<ModuloIndexer>(max_partitions);
}

std::unique_ptr<Processor> RediSearchBenchmark::GetProcessor() {
	return std::make_unique<RediSearchProcessor>(options_, factory_);
}

Json::Value RediSearchBenchmark::GetConfigurationParametersMap() const {
	Json::Value configs{Json::objectValue};
	configs["host"] = options_.host;
	configs["connections"] = static_cast<Json::UInt64>(options_.connections);
	configs["pipeline"] = static_cast<Json::UInt64>(options_.pipeline);
	configs["clusterMode"] = options_.cluster_mode;
	configs["continueOnError"] = options_.continue_on_error;
	configs["measureRxBytes"] = options_.measure_rx_bytes;
	configs["indexSchema"] = index_schema_;
	return configs;
}

}  // namespace Ftsb
