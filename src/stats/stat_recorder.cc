#include "stat_recorder.h"

#include <cmath>

#include <glog/logging.h>

#include "common/config.h"

namespace Ftsb {

double WrapInvalid(double value) {
	if (std::isnan(value) || std::isinf(value)) {
		return kInvalidMetric;
	}
	return value;
}

double CalculateRate(double current, double prev, double seconds) {
	return WrapInvalid((current - prev) / seconds);
}

double CalculateRatio(double numerator, double denominator) {
	return WrapInvalid(numerator / denominator);
}

void StatRecorder::RecordCmd(const CmdStat& cmd) {
	tx_total_bytes_.fetch_add(cmd.tx_bytes, std::memory_order_relaxed);
	rx_total_bytes_.fetch_add(cmd.rx_bytes, std::memory_order_relaxed);

	const bool known = cmd.category != CmdCategory::kUnknown;
	if (!known && unrecognized_.fetch_add(1, std::memory_order_relaxed) == 0) {
		LOG(WARNING) << "Command " << cmd.id << " has an unrecognized category; "
			"it counts towards the totals only";
	}

	// Every histogram shares the same bounds, so the first one decides
	const int64_t latency = static_cast<int64_t>(cmd.latency_us);
	if (!total_cumulative_.RecordValue(latency)) {
		out_of_range_.fetch_add(1, std::memory_order_relaxed);
		LOG_EVERY_N(WARNING, 10000) << "Dropping out of range latency " << cmd.latency_us
			<< "us (" << google::COUNTER << " so far)";
		return;
	}
	if (known) {
		cumulative_[Index(cmd.category)].RecordValue(latency);
		instantaneous_[Index(cmd.category)].RecordValue(latency);
	}
}

void StatRecorder::Record(const Stat& stat) {
	for (const CmdStat& cmd : stat.CmdStats()) {
		RecordCmd(cmd);
	}
}

StatRecorder::Counts StatRecorder::Snapshot() const {
	Counts c;
	for (CmdCategory category : kAllCategories) {
		int64_t n = Cumulative(category).TotalCount();
		c.per_category[Index(category)] = n;
		c.category_ops += n;
	}
	c.total_ops = total_cumulative_.TotalCount();
	c.tx_bytes = TxTotalBytes();
	c.rx_bytes = RxTotalBytes();
	return c;
}

StatRecorder::Ratios StatRecorder::MeasuredRatios() const {
	Counts c = Snapshot();
	auto count = [&c](CmdCategory category) {
		return static_cast<double>(c.per_category[Index(category)]);
	};
	const double total = static_cast<double>(c.total_ops);

	Ratios r;
	r.write = CalculateRatio(count(CmdCategory::kWrite) + count(CmdCategory::kSetupWrite), total);
	r.read = CalculateRatio(count(CmdCategory::kRead) + count(CmdCategory::kCursorRead), total);
	r.update = CalculateRatio(count(CmdCategory::kUpdate), total);
	r.del = CalculateRatio(count(CmdCategory::kDelete), total);
	return r;
}

}  // namespace Ftsb
