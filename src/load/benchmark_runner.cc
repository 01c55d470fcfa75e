#include "benchmark_runner.h"

#include <algorithm>
#include <thread>

#include <glog/logging.h>

#include "common/config.h"
#include "record_decoder.h"
#include "scanner.h"
#include "stats/reporter.h"

namespace Ftsb {

BenchmarkRunner::BenchmarkRunner(const Configuration& config, std::ostream& table, std::ostream& summary)
	: db_name_(config.config().target.index.get()),
	  input_file_(config.config().load.file.get()),
	  json_out_file_(config.config().report.json_out_file.get()),
	  metadata_(config.config().report.metadata.get()),
	  workers_(config.getWorkers()),
	  work_queues_(config.getWorkQueueCount()),
	  batch_size_(config.getBatchSize()),
	  limit_(config.config().load.limit.get()),
	  do_load_(config.config().load.do_load.get()),
	  do_create_db_(config.config().database.do_create_db.get()),
	  do_abort_on_exist_(config.config().database.do_abort_on_exist.get()),
	  reporting_period_(config.getReportingPeriod()),
	  table_(table),
	  summary_(summary) {}

std::function<void()> BenchmarkRunner::UseDBCreator(DBCreator* creator) {
	if (creator == nullptr) {
		return [] {};
	}

	creator->Init();
	bool exists = creator->DBExists(db_name_);
	if (exists && do_abort_on_exist_) {
		LOG(FATAL) << "Database \"" << db_name_ << "\" exists: aborting";
	}

	if (do_create_db_) {
		std::string error;
		if (exists) {
			LOG(INFO) << "Removing existing database \"" << db_name_ << "\"";
			if (!creator->RemoveOldDB(db_name_, &error)) {
				LOG(FATAL) << "Failed to remove database \"" << db_name_ << "\": " << error;
			}
		}
		if (!creator->CreateDB(db_name_, &error)) {
			LOG(FATAL) << "Failed to create database \"" << db_name_ << "\": " << error;
		}
		creator->PostCreateDB(db_name_);
		LOG(INFO) << "Created database \"" << db_name_ << "\"";
	}

	return [creator] { creator->Close(); };
}

std::vector<std::unique_ptr<DuplexChannel>> BenchmarkRunner::CreateChannels(unsigned queues) {
	const unsigned workers = static_cast<unsigned>(workers_);
	if (queues == 0 || queues > workers) {
		LOG(FATAL) << "Cannot have " << queues << " work queues for " << workers << " workers";
	}
	const size_t capacity = (workers + queues - 1) / queues;

	std::vector<std::unique_ptr<DuplexChannel>> channels;
	channels.reserve(queues);
	for (unsigned q = 0; q < queues; ++q) {
		size_t consumers = 0;
		for (unsigned w = 0; w < workers; ++w) {
			if (w % queues == q) ++consumers;
		}
		channels.push_back(std::make_unique<DuplexChannel>(capacity, consumers));
	}
	return channels;
}

void BenchmarkRunner::Work(Processor& processor, DuplexChannel& channel, BatchPool& pool, int worker_index) {
	processor.Init(worker_index, do_load_, workers_);

	std::unique_ptr<Batch> batch;
	uint64_t processed = 0;
	while (channel.Receive(&batch)) {
		Stat stat = processor.ProcessBatch(*batch, do_load_);
		recorder_.Record(stat);
		pool.Release(std::move(batch));
		channel.Ack();
		++processed;
	}

	processor.Close(do_load_);
	batches_processed_.fetch_add(processed, std::memory_order_relaxed);
	VLOG(1) << "Worker " << worker_index << " processed " << processed << " batches";
}

void BenchmarkRunner::Run(Benchmark& benchmark) {
	InputSource input(input_file_);
	LOG(INFO) << "Reading records from " << input.name();
	Run(benchmark, input.stream());
}

void BenchmarkRunner::Run(Benchmark& benchmark, std::istream& in) {
	std::function<void()> cleanup = [] {};
	if (do_load_) {
		cleanup = UseDBCreator(benchmark.GetDBCreator());
	}

	std::vector<std::unique_ptr<DuplexChannel>> channels = CreateChannels(work_queues_);
	std::vector<DuplexChannel*> channel_ptrs;
	for (auto& channel : channels) {
		channel_ptrs.push_back(channel.get());
	}

	BatchPool pool(batch_size_);
	std::unique_ptr<RecordDecoder> decoder = benchmark.GetCmdDecoder(in);
	std::unique_ptr<RecordIndexer> indexer = benchmark.GetCommandIndexer(work_queues_);

	std::vector<std::unique_ptr<Processor>> processors;
	processors.reserve(workers_);
	for (int i = 0; i < workers_; ++i) {
		processors.push_back(benchmark.GetProcessor());
	}

	LOG(INFO) << "Starting " << workers_ << " workers on " << work_queues_ << " work queues, batch size "
		<< batch_size_ << (do_load_ ? "" : " (dry run)");

	const auto wall_start = std::chrono::system_clock::now();
	const auto start = std::chrono::steady_clock::now();

	std::vector<std::thread> workers;
	workers.reserve(workers_);
	for (int i = 0; i < workers_; ++i) {
		DuplexChannel& channel = *channels[i % channels.size()];
		workers.emplace_back(&BenchmarkRunner::Work, this, std::ref(*processors[i]),
				std::ref(channel), std::ref(pool), i);
	}

	Reporter reporter(recorder_, table_);
	reporter.Start(reporting_period_, start);

	Scanner scanner(channel_ptrs, pool);
	records_scanned_ = scanner.Scan(*decoder, *indexer, batch_size_, limit_);
	batches_sent_ = scanner.batches_sent();

	for (std::thread& worker : workers) {
		worker.join();
	}
	const auto end = std::chrono::steady_clock::now();
	const auto wall_end = std::chrono::system_clock::now();
	reporter.Stop();

	for (const auto& channel : channels) {
		max_outstanding_ = std::max(max_outstanding_, channel->HighWatermark());
	}

	const auto took = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
	result_ = reporter.BuildResult(took);
	result_.db_name = db_name_;
	result_.metadata = metadata_;
	result_.result_format_version = kResultFormatVersion;
	result_.start_time = std::chrono::duration_cast<std::chrono::seconds>(wall_start.time_since_epoch()).count();
	result_.end_time = std::chrono::duration_cast<std::chrono::seconds>(wall_end.time_since_epoch()).count();
	result_.duration_millis = std::chrono::duration_cast<std::chrono::milliseconds>(took).count();
	result_.batch_size = static_cast<int64_t>(batch_size_);
	result_.workers = static_cast<uint64_t>(workers_);
	result_.limit = limit_;
	result_.db_specific_configs = benchmark.GetConfigurationParametersMap();

	reporter.PrintSummary(result_, summary_);

	if (!json_out_file_.empty()) {
		std::string error;
		if (!WriteResultFile(result_, json_out_file_, &error)) {
			LOG(FATAL) << "Failed to write result document: " << error;
		}
		LOG(INFO) << "Saved results to " << json_out_file_;
	}

	cleanup();
}

}  // namespace Ftsb
