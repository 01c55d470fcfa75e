#include "redisearch_processor.h"

#include <glog/logging.h>

namespace Ftsb {

std::unique_ptr<PipelineClient> DefaultPipelineClientFactory(const RediSearchOptions& options) {
	return NewPipelineClient(options.host, options.connections, options.cluster_mode);
}

RediSearchProcessor::RediSearchProcessor(RediSearchOptions options, PipelineClientFactory factory)
	: options_(std::move(options)), factory_(std::move(factory)) {}

void RediSearchProcessor::Init(int worker_index, bool do_load, int total_workers) {
	worker_index_ = worker_index;
	if (!do_load) {
		return;
	}
	client_ = factory_(options_);
	dispatcher_ = std::make_unique<PipelineDispatcher>(*client_, options_.pipeline,
			options_.continue_on_error, options_.measure_rx_bytes);
	VLOG(1) << "Worker " << worker_index << "/" << total_workers << " connected to " << options_.host
		<< (options_.cluster_mode ? " (cluster)" : "");
}

Stat RediSearchProcessor::ProcessBatch(const Batch& batch, bool do_load) {
	Stat stat;
	if (!do_load) {
		return stat;
	}
	if (!dispatcher_) {
		LOG(FATAL) << "Worker " << worker_index_ << " processing a batch before Init";
	}
	for (const Record& record : batch.records()) {
		dispatcher_->Enqueue(record, &stat);
	}
	dispatcher_->Flush(&stat);
	return stat;
}

void RediSearchProcessor::Close(bool do_load) {
	if (do_load && dispatcher_ && dispatcher_->FailedFlushes() > 0) {
		LOG(WARNING) << "Worker " << worker_index_ << ": " << dispatcher_->FailedFlushes()
			<< " pipelines failed and were skipped";
	}
	dispatcher_.reset();
	client_.reset();
}

}  // namespace Ftsb
