#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <thread>

#include "absl/synchronization/mutex.h"

#include "stat_recorder.h"
#include "test_result.h"

namespace Ftsb {

/**
 * Periodic and final reporting over a StatRecorder.
 *
 * Every tick prints one table row (windowed rate and cumulative p50 per
 * category, current ops/sec, total ops, TX/RX byte rates), appends one
 * DataPoint per category and resets the instantaneous histograms. The
 * reporter only reads the recorder; it never blocks scanner or workers.
 *
 * @threading Start/Stop from the owning thread. Tick runs on the ticker
 *            thread, or directly from tests when no ticker was started.
 */
class Reporter {
public:
	using SystemTime = std::chrono::system_clock::time_point;
	using SteadyTime = std::chrono::steady_clock::time_point;

	/**
	 * @param table Destination of the periodic table (stderr in main)
	 */
	Reporter(StatRecorder& recorder, std::ostream& table);
	~Reporter();

	Reporter(const Reporter&) = delete;
	Reporter& operator=(const Reporter&) = delete;

	/**
	 * Prints the header and starts ticking every `period` from `start`.
	 * A zero period only sets the first window's origin; Tick() is then
	 * left to the caller.
	 */
	void Start(std::chrono::nanoseconds period, SteadyTime start);

	/// Stops the ticker thread; idempotent
	void Stop();

	void PrintHeader();

	/**
	 * One reporting step covering the window since the previous tick
	 * @param wall_now Timestamp stored in the DataPoints
	 * @param now Monotonic time used for the window length
	 */
	void Tick(SystemTime wall_now, SteadyTime now);

	size_t TickCount() const;

	/// Per-category series ordered by timestamp
	std::array<TimeSeries, kNumCategories> SortedTimeSeries() const;

	/**
	 * Fills totals, ratios, overall rates (over `took`), sorted series and
	 * cumulative quantiles. Run parameters are left to the caller.
	 */
	TestResult BuildResult(std::chrono::nanoseconds took) const;

	/// Final human-readable summary
	void PrintSummary(const TestResult& result, std::ostream& out) const;

private:
	StatRecorder& recorder_;
	std::ostream& table_;

	// Previous tick state; only touched by the ticking thread
	SteadyTime prev_time_;
	StatRecorder::Counts prev_counts_;

	mutable absl::Mutex series_mutex_;
	std::array<TimeSeries, kNumCategories> series_ ABSL_GUARDED_BY(series_mutex_);
	size_t ticks_ ABSL_GUARDED_BY(series_mutex_) = 0;

	std::thread ticker_;
	std::mutex ticker_mutex_;
	std::condition_variable ticker_cv_;
	std::atomic<bool> running_{false};

	void TickerLoop(std::chrono::nanoseconds period);
};

}  // namespace Ftsb
