#include "pipeline_dispatcher.h"

#include <glog/logging.h>

namespace Ftsb {

PipelineDispatcher::PipelineDispatcher(PipelineClient& client, size_t pipeline, bool continue_on_error,
		bool measure_rx_bytes)
	: client_(client),
	  pipeline_(pipeline == 0 ? 1 : pipeline),
	  continue_on_error_(continue_on_error),
	  measure_rx_bytes_(measure_rx_bytes) {
	commands_.reserve(pipeline_);
	pending_.reserve(pipeline_);
}

void PipelineDispatcher::Enqueue(const Record& record, Stat* stat) {
	RedisCommand command;
	command.reserve(record.args.size() + 1);
	command.push_back(record.command);
	command.insert(command.end(), record.args.begin(), record.args.end());

	commands_.push_back(std::move(command));
	pending_.push_back(PendingCmd{record.category, record.id, record.tx_bytes,
			std::chrono::steady_clock::now()});

	if (commands_.size() >= pipeline_) {
		Flush(stat);
	}
}

void PipelineDispatcher::Flush(Stat* stat) {
	if (commands_.empty()) {
		return;
	}

	std::string error;
	bool ok = client_.Do(commands_, measure_rx_bytes_ ? &rx_bytes_ : nullptr, &error);
	const auto completed = std::chrono::steady_clock::now();

	if (!ok) {
		++failed_flushes_;
		if (!continue_on_error_) {
			LOG(FATAL) << "Pipeline of " << commands_.size() << " commands failed: " << error;
		}
		VLOG(1) << "Received an error with a pipeline of " << commands_.size()
			<< " commands (first id " << pending_.front().id << "): " << error;
	} else {
		for (size_t i = 0; i < pending_.size(); ++i) {
			PendingCmd& cmd = pending_[i];
			uint64_t latency_us = static_cast<uint64_t>(
				std::chrono::duration_cast<std::chrono::microseconds>(completed - cmd.enqueued).count());
			uint64_t rx = measure_rx_bytes_ && i < rx_bytes_.size() ? rx_bytes_[i] : 0;
			stat->AddEntry(cmd.category, std::move(cmd.id), latency_us,
					cmd.category == CmdCategory::kUpdate, cmd.category == CmdCategory::kDelete,
					cmd.tx_bytes, rx);
		}
	}

	commands_.clear();
	pending_.clear();
}

}  // namespace Ftsb
