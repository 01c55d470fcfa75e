#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "benchmark.h"
#include "batch.h"
#include "duplex_channel.h"
#include "common/configuration.h"
#include "stats/stat_recorder.h"
#include "stats/test_result.h"

namespace Ftsb {

/**
 * Drives one benchmark run: database setup, one scanner feeding the work
 * queues, a pool of workers processing batches, periodic reporting and the
 * final summary/result document.
 *
 * Settings are read from the Configuration once, at construction.
 */
class BenchmarkRunner {
public:
	/**
	 * @param table Destination of the periodic table
	 * @param summary Destination of the final summary
	 */
	BenchmarkRunner(const Configuration& config, std::ostream& table, std::ostream& summary);

	BenchmarkRunner(const BenchmarkRunner&) = delete;
	BenchmarkRunner& operator=(const BenchmarkRunner&) = delete;

	/**
	 * Runs against the configured input file (standard input when unset).
	 */
	void Run(Benchmark& benchmark);

	/**
	 * Runs reading records from `in`.
	 */
	void Run(Benchmark& benchmark, std::istream& in);

	const std::string& DatabaseName() const { return db_name_; }

	const StatRecorder& recorder() const { return recorder_; }
	const TestResult& result() const { return result_; }
	uint64_t records_scanned() const { return records_scanned_; }
	uint64_t batches_sent() const { return batches_sent_; }
	uint64_t batches_processed() const { return batches_processed_.load(); }

	// Largest number of unacknowledged batches seen on any work queue
	size_t max_outstanding() const { return max_outstanding_; }

private:
	// Snapshot of the configuration
	const std::string db_name_;
	const std::string input_file_;
	const std::string json_out_file_;
	const std::string metadata_;
	const int workers_;
	const unsigned work_queues_;
	const size_t batch_size_;
	const uint64_t limit_;
	const bool do_load_;
	const bool do_create_db_;
	const bool do_abort_on_exist_;
	const std::chrono::nanoseconds reporting_period_;

	std::ostream& table_;
	std::ostream& summary_;

	StatRecorder recorder_;
	TestResult result_;
	uint64_t records_scanned_ = 0;
	uint64_t batches_sent_ = 0;
	std::atomic<uint64_t> batches_processed_{0};
	size_t max_outstanding_ = 0;

	/**
	 * Prepares the database and returns the deferred cleanup.
	 * Aborting on an existing database or failing to (re)create it is fatal.
	 */
	std::function<void()> UseDBCreator(DBCreator* creator);

	/**
	 * One channel per work queue. Queue q is shared by the workers i with
	 * i % queues == q and holds up to ceil(workers / queues) batches.
	 */
	std::vector<std::unique_ptr<DuplexChannel>> CreateChannels(unsigned queues);

	void Work(Processor& processor, DuplexChannel& channel, BatchPool& pool, int worker_index);
};

}  // namespace Ftsb
