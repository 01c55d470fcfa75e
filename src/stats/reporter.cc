#include "reporter.h"

#include <iomanip>
#include <sstream>

#include <glog/logging.h>

#include "common/config.h"
#include "common/units.h"

namespace Ftsb {

namespace {

constexpr int kColumnWidth = 20;

constexpr const char* kColumnHeaders[] = {
	"setup writes/sec", "writes/sec", "updates/sec", "reads/sec", "cursor reads/sec",
	"deletes/sec", "current ops/sec", "total ops", "TX BW/s", "RX BW/s",
};

double Seconds(std::chrono::nanoseconds d) {
	return std::chrono::duration<double>(d).count();
}

// "<rate> (<p50 ms>)"
std::string RateCell(double rate, double p50_ms) {
	std::ostringstream cell;
	cell << std::fixed << std::setprecision(0) << rate
		<< " (" << std::setprecision(3) << p50_ms << ")";
	return cell.str();
}

std::string ByteRate(double rate) {
	return FormatByteSize(rate > 0 ? static_cast<uint64_t>(rate) : 0);
}

// "1.5K" -> "1.5KB", "512B" stays
std::string WithByteUnit(const std::string& size) {
	return !size.empty() && size.back() == 'B' ? size : size + "B";
}

}  // namespace

Reporter::Reporter(StatRecorder& recorder, std::ostream& table)
	: recorder_(recorder), table_(table) {}

Reporter::~Reporter() {
	Stop();
}

void Reporter::Start(std::chrono::nanoseconds period, SteadyTime start) {
	prev_time_ = start;
	prev_counts_ = StatRecorder::Counts{};
	if (period <= std::chrono::nanoseconds::zero()) {
		return;
	}
	if (running_.exchange(true)) {
		LOG(WARNING) << "Reporter already started";
		return;
	}
	PrintHeader();
	ticker_ = std::thread(&Reporter::TickerLoop, this, period);
	VLOG(1) << "Reporting every " << FormatDuration(period);
}

void Reporter::Stop() {
	{
		std::lock_guard<std::mutex> lock(ticker_mutex_);
		running_.store(false);
	}
	ticker_cv_.notify_all();
	if (ticker_.joinable()) {
		ticker_.join();
	}
}

void Reporter::TickerLoop(std::chrono::nanoseconds period) {
	auto deadline = prev_time_ + period;
	while (true) {
		{
			std::unique_lock<std::mutex> lock(ticker_mutex_);
			if (ticker_cv_.wait_until(lock, deadline, [this] { return !running_.load(); })) {
				break;
			}
		}
		Tick(std::chrono::system_clock::now(), std::chrono::steady_clock::now());
		deadline += period;
		// Skip ticks missed while the machine was stalled
		auto now = std::chrono::steady_clock::now();
		while (deadline <= now) {
			deadline += period;
		}
	}
	VLOG(1) << "Reporter stopped after " << TickCount() << " ticks";
}

void Reporter::PrintHeader() {
	for (const char* header : kColumnHeaders) {
		table_ << std::right << std::setw(kColumnWidth) << header;
	}
	table_ << std::endl;
}

void Reporter::Tick(SystemTime wall_now, SteadyTime now) {
	const double took = Seconds(now - prev_time_);
	const StatRecorder::Counts counts = recorder_.Snapshot();
	const int64_t timestamp =
		std::chrono::duration_cast<std::chrono::seconds>(wall_now.time_since_epoch()).count();

	{
		absl::MutexLock lock(&series_mutex_);
		for (CmdCategory category : kAllCategories) {
			LatencyHistogram::Snapshot window = recorder_.Instantaneous(category).SnapshotAndReset();
			DataPoint dp;
			dp.timestamp = timestamp;
			dp.values["q50"] = window.q50_ms;
			dp.values["q95"] = window.q95_ms;
			dp.values["q99"] = window.q99_ms;
			dp.values["rate"] = CalculateRate(static_cast<double>(window.count), 0, took);
			series_[static_cast<size_t>(category)].push_back(std::move(dp));
		}
		++ticks_;
	}

	for (CmdCategory category : kAllCategories) {
		const size_t i = static_cast<size_t>(category);
		double rate = CalculateRate(static_cast<double>(counts.per_category[i]),
				static_cast<double>(prev_counts_.per_category[i]), took);
		table_ << std::right << std::setw(kColumnWidth)
			<< RateCell(rate, recorder_.Cumulative(category).Summary().q50_ms);
	}
	double current_ops = CalculateRate(static_cast<double>(counts.category_ops),
			static_cast<double>(prev_counts_.category_ops), took);
	double tx_rate = CalculateRate(static_cast<double>(counts.tx_bytes),
			static_cast<double>(prev_counts_.tx_bytes), took);
	double rx_rate = CalculateRate(static_cast<double>(counts.rx_bytes),
			static_cast<double>(prev_counts_.rx_bytes), took);

	table_ << std::right << std::setw(kColumnWidth)
		<< RateCell(current_ops, recorder_.TotalCumulative().Summary().q50_ms)
		<< std::setw(kColumnWidth) << counts.category_ops
		<< std::setw(kColumnWidth) << WithByteUnit(ByteRate(tx_rate)) + "/s"
		<< std::setw(kColumnWidth) << WithByteUnit(ByteRate(rx_rate)) + "/s"
		<< std::endl;

	prev_counts_ = counts;
	prev_time_ = now;
}

size_t Reporter::TickCount() const {
	absl::MutexLock lock(&series_mutex_);
	return ticks_;
}

std::array<TimeSeries, kNumCategories> Reporter::SortedTimeSeries() const {
	std::array<TimeSeries, kNumCategories> sorted;
	{
		absl::MutexLock lock(&series_mutex_);
		sorted = series_;
	}
	for (TimeSeries& series : sorted) {
		SortByTimestamp(&series);
	}
	return sorted;
}

TestResult Reporter::BuildResult(std::chrono::nanoseconds took) const {
	TestResult result;
	const StatRecorder::Counts counts = recorder_.Snapshot();
	auto count = [&counts](CmdCategory category) {
		return counts.per_category[static_cast<size_t>(category)];
	};

	result.totals.total_ops = counts.category_ops;
	result.totals.setup_writes = count(CmdCategory::kSetupWrite);
	result.totals.writes = count(CmdCategory::kWrite);
	result.totals.reads = count(CmdCategory::kRead);
	result.totals.reads_cursor = count(CmdCategory::kCursorRead);
	result.totals.updates = count(CmdCategory::kUpdate);
	result.totals.deletes = count(CmdCategory::kDelete);
	result.totals.unrecognized = static_cast<int64_t>(recorder_.UnrecognizedCount());
	result.totals.tx_bytes = counts.tx_bytes;
	result.totals.rx_bytes = counts.rx_bytes;

	const StatRecorder::Ratios ratios = recorder_.MeasuredRatios();
	result.measured_ratios.write = ratios.write;
	result.measured_ratios.read = ratios.read;
	result.measured_ratios.update = ratios.update;
	result.measured_ratios.del = ratios.del;

	const double seconds = Seconds(took);
	for (CmdCategory category : kAllCategories) {
		const size_t i = static_cast<size_t>(category);
		result.overall_rates.per_category[i] =
			CalculateRate(static_cast<double>(counts.per_category[i]), 0, seconds);

		LatencyHistogram::Snapshot summary = recorder_.Cumulative(category).Summary();
		result.overall_quantiles[i] = QuantileSet{summary.q50_ms, summary.q95_ms, summary.q99_ms};
	}
	result.overall_rates.overall_ops = CalculateRate(static_cast<double>(counts.category_ops), 0, seconds);
	result.overall_rates.overall_tx_bytes = CalculateRate(static_cast<double>(counts.tx_bytes), 0, seconds);
	result.overall_rates.overall_rx_bytes = CalculateRate(static_cast<double>(counts.rx_bytes), 0, seconds);
	result.overall_rates.tx_byte_rate_str = ByteRate(result.overall_rates.overall_tx_bytes);
	result.overall_rates.rx_byte_rate_str = ByteRate(result.overall_rates.overall_rx_bytes);

	result.time_series = SortedTimeSeries();
	return result;
}

void Reporter::PrintSummary(const TestResult& result, std::ostream& out) const {
	const double seconds = static_cast<double>(result.duration_millis) / 1000.0;
	auto line = [&out](const char* name, const char* tabs, double rate, double p50_ms) {
		out << "\t- " << name << " " << std::setprecision(0) << rate << " ops/sec" << tabs
			<< "q50 lat " << std::setprecision(3) << p50_ms << " ms\n";
	};
	auto q50 = [&result](CmdCategory category) {
		return result.overall_quantiles[static_cast<size_t>(category)].q50;
	};
	auto rate = [&result](CmdCategory category) {
		return result.overall_rates.per_category[static_cast<size_t>(category)];
	};

	out << std::fixed;
	out << "\nSummary:\n";
	out << "Issued " << result.totals.total_ops << " Commands in " << std::setprecision(3)
		<< seconds << "sec with " << result.workers << " workers\n";
	out << "\tOverall stats:\n";
	line("Total", "\t\t\t", result.overall_rates.overall_ops,
			recorder_.TotalCumulative().Summary().q50_ms);
	line("Setup Writes", "\t\t", rate(CmdCategory::kSetupWrite), q50(CmdCategory::kSetupWrite));
	line("Writes", "\t\t\t", rate(CmdCategory::kWrite), q50(CmdCategory::kWrite));
	line("Reads", "\t\t\t", rate(CmdCategory::kRead), q50(CmdCategory::kRead));
	line("Cursor Reads", "\t\t", rate(CmdCategory::kCursorRead), q50(CmdCategory::kCursorRead));
	line("Updates", "\t\t\t", rate(CmdCategory::kUpdate), q50(CmdCategory::kUpdate));
	line("Deletes", "\t\t\t", rate(CmdCategory::kDelete), q50(CmdCategory::kDelete));
	if (result.totals.unrecognized > 0) {
		out << "\t- Unrecognized " << result.totals.unrecognized << " commands\n";
	}
	out << "\tOverall TX Byte Rate: " << WithByteUnit(result.overall_rates.tx_byte_rate_str) << "/sec\n";
	out << "\tOverall RX Byte Rate: " << WithByteUnit(result.overall_rates.rx_byte_rate_str) << "/sec\n";
	out.flush();
}

}  // namespace Ftsb
