#pragma once

#include <functional>
#include <memory>
#include <string>

#include "load/processor.h"
#include "pipeline_dispatcher.h"
#include "redis_client.h"

namespace Ftsb {

/**
 * Connection and dispatch settings shared by every RediSearch worker.
 */
struct RediSearchOptions {
	std::string host = "localhost:6379";
	size_t connections = 1;
	bool cluster_mode = false;
	size_t pipeline = 50;
	bool continue_on_error = false;
	bool measure_rx_bytes = false;
};

using PipelineClientFactory = std::function<std::unique_ptr<PipelineClient>(const RediSearchOptions&)>;

/// Connects a hiredis pool, or a cluster client in cluster mode
std::unique_ptr<PipelineClient> DefaultPipelineClientFactory(const RediSearchOptions& options);

/**
 * Sends every record of a batch through a PipelineDispatcher. Pending
 * commands are flushed at the end of each batch so every record is measured.
 */
class RediSearchProcessor : public Processor {
public:
	explicit RediSearchProcessor(RediSearchOptions options,
			PipelineClientFactory factory = DefaultPipelineClientFactory);

	void Init(int worker_index, bool do_load, int total_workers) override;
	Stat ProcessBatch(const Batch& batch, bool do_load) override;
	void Close(bool do_load) override;

	uint64_t FailedFlushes() const { return dispatcher_ ? dispatcher_->FailedFlushes() : 0; }

private:
	RediSearchOptions options_;
	PipelineClientFactory factory_;
	int worker_index_ = -1;

	std::unique_ptr<PipelineClient> client_;
	std::unique_ptr<PipelineDispatcher> dispatcher_;
};

}  // namespace Ftsb
