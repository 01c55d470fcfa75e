#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "batch.h"
#include "duplex_channel.h"
#include "indexer.h"
#include "record_decoder.h"

namespace Ftsb {

/**
 * The single producer: reads records, groups them per partition and feeds
 * the work queues. Partition i is served by channels[i].
 */
class Scanner {
public:
	Scanner(const std::vector<DuplexChannel*>& channels, BatchPool& pool)
		: channels_(channels), pool_(pool) {}

	/**
	 * Reads until the input ends or `limit` records were read (0 = no limit),
	 * flushes partial batches and closes every channel.
	 * @return Number of records read
	 */
	uint64_t Scan(RecordDecoder& decoder, RecordIndexer& indexer, size_t batch_size, uint64_t limit);

	uint64_t batches_sent() const { return batches_sent_; }

private:
	std::vector<DuplexChannel*> channels_;
	BatchPool& pool_;
	uint64_t batches_sent_ = 0;
};

}  // namespace Ftsb
