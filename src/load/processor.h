#pragma once

#include "batch.h"
#include "stat.h"

namespace Ftsb {

/**
 * Turns batches into commands against the target. One instance per worker;
 * never shared between threads.
 */
class Processor {
public:
	virtual ~Processor() = default;

	/**
	 * Per-worker setup before the first batch arrives
	 * @param worker_index Index of the owning worker
	 * @param do_load False for dry runs; no connection is needed then
	 * @param total_workers Size of the worker pool
	 */
	virtual void Init(int worker_index, bool do_load, int total_workers) = 0;

	/**
	 * Dispatches every record of the batch.
	 * @param do_load When false, nothing is sent and no stats are produced
	 * @return One CmdStat per measured command
	 */
	virtual Stat ProcessBatch(const Batch& batch, bool do_load) = 0;

	/**
	 * Called once after the worker's channel is drained.
	 */
	virtual void Close(bool do_load) { (void)do_load; }
};

}  // namespace Ftsb
