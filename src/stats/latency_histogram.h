#pragma once

#include <cstdint>

#include "absl/synchronization/mutex.h"

struct hdr_histogram;

namespace Ftsb {

/**
 * Thread-safe HDR histogram of latencies in microseconds, tracking
 * [kHistogramLowest, kHistogramHighest] with kHistogramSignificantFigures.
 */
class LatencyHistogram {
public:
	struct Snapshot {
		int64_t count = 0;
		// Milliseconds; zero when count is zero
		double q50_ms = 0.0;
		double q95_ms = 0.0;
		double q99_ms = 0.0;
	};

	LatencyHistogram();
	~LatencyHistogram();

	LatencyHistogram(const LatencyHistogram&) = delete;
	LatencyHistogram& operator=(const LatencyHistogram&) = delete;

	/**
	 * @return false (and records nothing) when value is out of range
	 */
	bool RecordValue(int64_t value);

	int64_t TotalCount() const;

	/**
	 * @param quantile Percentile in [0, 100]
	 */
	int64_t ValueAtQuantile(double quantile) const;

	void Reset();

	Snapshot Summary() const;

	// Summary() and Reset() under one lock, so no value is lost in between
	Snapshot SnapshotAndReset();

private:
	mutable absl::Mutex mutex_;
	hdr_histogram* histogram_ ABSL_GUARDED_BY(mutex_) = nullptr;

	Snapshot SummaryLocked() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
};

}  // namespace Ftsb
