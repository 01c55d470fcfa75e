#include "scanner.h"

#include <glog/logging.h>

namespace Ftsb {

uint64_t Scanner::Scan(RecordDecoder& decoder, RecordIndexer& indexer, size_t batch_size, uint64_t limit) {
	const size_t partitions = channels_.size();
	std::vector<std::unique_ptr<Batch>> filling(partitions);
	uint64_t items_read = 0;

	Record record;
	while (limit == 0 || items_read < limit) {
		if (!decoder.Decode(&record)) {
			break;
		}
		unsigned idx = indexer.GetIndex(items_read, record);
		if (idx >= partitions) {
			LOG(FATAL) << "Indexer returned partition " << idx << " for " << partitions << " partitions";
		}

		std::unique_ptr<Batch>& batch = filling[idx];
		if (!batch) {
			batch = pool_.Acquire();
		}
		batch->Append(std::move(record));
		record = Record();
		++items_read;

		if (batch->Len() >= batch_size) {
			channels_[idx]->Send(std::move(batch));
			++batches_sent_;
		}
	}

	// Flush partially filled batches
	for (size_t i = 0; i < partitions; ++i) {
		if (filling[i] && !filling[i]->Empty()) {
			channels_[i]->Send(std::move(filling[i]));
			++batches_sent_;
		} else if (filling[i]) {
			pool_.Release(std::move(filling[i]));
		}
	}

	for (DuplexChannel* channel : channels_) {
		channel->Close();
	}

	if (decoder.MalformedCount() > 0) {
		LOG(WARNING) << "Skipped " << decoder.MalformedCount() << " malformed records";
	}
	VLOG(1) << "Scanner read " << items_read << " records in " << batches_sent_ << " batches";
	return items_read;
}

}  // namespace Ftsb
