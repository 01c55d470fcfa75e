#pragma once

#include <memory>

#include "common/configuration.h"
#include "load/benchmark.h"
#include "redisearch_db_creator.h"
#include "redisearch_processor.h"

namespace Ftsb {

/**
 * RediSearch benchmark: CSV command records, round-robin partitioning,
 * hiredis pipelined processors and FT.CREATE/FT.DROPINDEX index lifecycle.
 */
class RediSearchBenchmark : public Benchmark {
public:
	explicit RediSearchBenchmark(const Configuration& config,
			PipelineClientFactory factory = DefaultPipelineClientFactory);

	std::unique_ptr<RecordDecoder> GetCmdDecoder(std::istream& in) override;
	std::unique_ptr<RecordIndexer> GetCommandIndexer(unsigned max_partitions) override;
	std::unique_ptr<Processor> GetProcessor() override;
	DBCreator* GetDBCreator() override { return &db_creator_; }
	Json::Value GetConfigurationParametersMap() const override;

	const RediSearchOptions& options() const { return options_; }

private:
	RediSearchOptions options_;
	PipelineClientFactory factory_;
	RediSearchDBCreator db_creator_;
	std::string index_schema_;
};

}  // namespace Ftsb
