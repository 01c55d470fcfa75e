#pragma once

#include <istream>
#include <memory>

#include <json/json.h>

#include "db_creator.h"
#include "indexer.h"
#include "processor.h"
#include "record_decoder.h"

namespace Ftsb {

/**
 * Everything target-specific a benchmark run needs. The runner only
 * schedules, dispatches and measures what these components produce.
 */
class Benchmark {
public:
	virtual ~Benchmark() = default;

	// Decoder reading records from the input stream
	virtual std::unique_ptr<RecordDecoder> GetCmdDecoder(std::istream& in) = 0;

	// Indexer spreading records over max_partitions work queues
	virtual std::unique_ptr<RecordIndexer> GetCommandIndexer(unsigned max_partitions) = 0;

	// A fresh processor; called once per worker
	virtual std::unique_ptr<Processor> GetProcessor() = 0;

	// Database lifecycle handler, or nullptr when there is nothing to manage
	virtual DBCreator* GetDBCreator() = 0;

	// Benchmark-specific settings recorded in the result document
	virtual Json::Value GetConfigurationParametersMap() const = 0;
};

}  // namespace Ftsb
