#include "latency_histogram.h"

#include <hdr/hdr_histogram.h>
#include <glog/logging.h>

#include "common/config.h"

namespace Ftsb {

LatencyHistogram::LatencyHistogram() {
	int rc = hdr_init(kHistogramLowest, kHistogramHighest, kHistogramSignificantFigures, &histogram_);
	if (rc != 0 || histogram_ == nullptr) {
		LOG(FATAL) << "hdr_init failed with code " << rc;
	}
}

LatencyHistogram::~LatencyHistogram() {
	hdr_close(histogram_);
}

bool LatencyHistogram::RecordValue(int64_t value) {
	if (value < kHistogramLowest || value > kHistogramHighest) {
		return false;
	}
	absl::MutexLock lock(&mutex_);
	return hdr_record_value(histogram_, value);
}

int64_t LatencyHistogram::TotalCount() const {
	absl::MutexLock lock(&mutex_);
	return histogram_->total_count;
}

int64_t LatencyHistogram::ValueAtQuantile(double quantile) const {
	absl::MutexLock lock(&mutex_);
	return hdr_value_at_percentile(histogram_, quantile);
}

void LatencyHistogram::Reset() {
	absl::MutexLock lock(&mutex_);
	hdr_reset(histogram_);
}

LatencyHistogram::Snapshot LatencyHistogram::SummaryLocked() const {
	Snapshot s;
	s.count = histogram_->total_count;
	if (s.count > 0) {
		s.q50_ms = static_cast<double>(hdr_value_at_percentile(histogram_, 50.0)) / 1000.0;
		s.q95_ms = static_cast<double>(hdr_value_at_percentile(histogram_, 95.0)) / 1000.0;
		s.q99_ms = static_cast<double>(hdr_value_at_percentile(histogram_, 99.0)) / 1000.0;
	}
	return s;
}

LatencyHistogram::Snapshot LatencyHistogram::Summary() const {
	absl::MutexLock lock(&mutex_);
	return SummaryLocked();
}

LatencyHistogram::Snapshot LatencyHistogram::SnapshotAndReset() {
	absl::MutexLock lock(&mutex_);
	Snapshot s = SummaryLocked();
	hdr_reset(histogram_);
	return s;
}

}  // namespace Ftsb
