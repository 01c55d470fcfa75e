#pragma once

#include <array>
#include <atomic>
#include <cstdint>

#include "latency_histogram.h"
#include "load/record.h"
#include "load/stat.h"

namespace Ftsb {

/**
 * Replaces NaN and infinities with kInvalidMetric. Every ratio and rate goes
 * through this before it is printed or serialized.
 */
double WrapInvalid(double value);

/// (current - prev) / seconds, wrapped
double CalculateRate(double current, double prev, double seconds);

/// numerator / denominator, wrapped (0/0 -> kInvalidMetric)
double CalculateRatio(double numerator, double denominator);

/**
 * Aggregation point shared by every worker. Each category owns a cumulative
 * and an instantaneous histogram; the instantaneous ones are reset by the
 * reporter after every tick. All members are safe to use concurrently.
 */
class StatRecorder {
public:
	struct Counts {
		std::array<int64_t, kNumCategories> per_category{};
		// Sum of the per-category counts
		int64_t category_ops = 0;
		// Everything recorded, unknown categories included
		int64_t total_ops = 0;
		uint64_t tx_bytes = 0;
		uint64_t rx_bytes = 0;
	};

	StatRecorder() = default;

	StatRecorder(const StatRecorder&) = delete;
	StatRecorder& operator=(const StatRecorder&) = delete;

	// Routes every CmdStat of a processed batch
	void Record(const Stat& stat);
	void RecordCmd(const CmdStat& cmd);

	LatencyHistogram& Cumulative(CmdCategory category) { return cumulative_[Index(category)]; }
	const LatencyHistogram& Cumulative(CmdCategory category) const { return cumulative_[Index(category)]; }
	LatencyHistogram& Instantaneous(CmdCategory category) { return instantaneous_[Index(category)]; }
	const LatencyHistogram& Instantaneous(CmdCategory category) const { return instantaneous_[Index(category)]; }

	LatencyHistogram& TotalCumulative() { return total_cumulative_; }
	const LatencyHistogram& TotalCumulative() const { return total_cumulative_; }

	uint64_t TxTotalBytes() const { return tx_total_bytes_.load(std::memory_order_relaxed); }
	uint64_t RxTotalBytes() const { return rx_total_bytes_.load(std::memory_order_relaxed); }
	uint64_t UnrecognizedCount() const { return unrecognized_.load(std::memory_order_relaxed); }
	uint64_t OutOfRangeCount() const { return out_of_range_.load(std::memory_order_relaxed); }

	Counts Snapshot() const;

	// Ratios of (setup) writes, (cursor) reads, updates and deletes over all ops
	struct Ratios {
		double write = 0;
		double read = 0;
		double update = 0;
		double del = 0;
	};
	Ratios MeasuredRatios() const;

private:
	std::array<LatencyHistogram, kNumCategories> cumulative_;
	std::array<LatencyHistogram, kNumCategories> instantaneous_;
	LatencyHistogram total_cumulative_;

	std::atomic<uint64_t> tx_total_bytes_{0};
	std::atomic<uint64_t> rx_total_bytes_{0};
	std::atomic<uint64_t> unrecognized_{0};
	std::atomic<uint64_t> out_of_range_{0};

	static size_t Index(CmdCategory category) { return static_cast<size_t>(category); }
};

}  // namespace Ftsb
