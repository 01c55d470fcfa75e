#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "load/record.h"
#include "load/stat.h"
#include "redis_client.h"

namespace Ftsb {

/**
 * Accumulates commands and sends them as one pipelined round trip once
 * `pipeline` are pending.
 *
 * Each command keeps its own enqueue time while the whole pipeline shares
 * the completion time of the round trip, so a command's latency is
 * completion - enqueue. Earlier commands of a window therefore report more
 * latency than they spent on the wire; results stay comparable with
 * historical runs this way.
 *
 * A failed round trip is fatal unless continue_on_error is set, in which
 * case the pending commands are dropped without stats.
 */
class PipelineDispatcher {
public:
	PipelineDispatcher(PipelineClient& client, size_t pipeline, bool continue_on_error, bool measure_rx_bytes);

	/**
	 * Queues the record's command. Flushes into *stat when the threshold is reached.
	 */
	void Enqueue(const Record& record, Stat* stat);

	/**
	 * Sends whatever is pending; no-op when nothing is.
	 */
	void Flush(Stat* stat);

	size_t Pending() const { return commands_.size(); }
	uint64_t FailedFlushes() const { return failed_flushes_; }

private:
	struct PendingCmd {
		CmdCategory category;
		std::string id;
		uint64_t tx_bytes;
		std::chrono::steady_clock::time_point enqueued;
	};

	PipelineClient& client_;
	const size_t pipeline_;
	const bool continue_on_error_;
	const bool measure_rx_bytes_;

	std::vector<RedisCommand> commands_;
	std::vector<PendingCmd> pending_;
	std::vector<uint64_t> rx_bytes_;
	uint64_t failed_flushes_ = 0;
};

}  // namespace Ftsb
