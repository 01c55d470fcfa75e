#include "batch.h"

namespace Ftsb {

std::unique_ptr<Batch> BatchPool::Acquire() {
	{
		absl::MutexLock lock(&mutex_);
		if (!free_.empty()) {
			std::unique_ptr<Batch> batch = std::move(free_.back());
			free_.pop_back();
			return batch;
		}
		++allocated_;
	}
	return std::make_unique<Batch>(batch_size_);
}

void BatchPool::Release(std::unique_ptr<Batch> batch) {
	if (!batch) {
		return;
	}
	batch->Clear();
	absl::MutexLock lock(&mutex_);
	if (free_.size() < max_free_) {
		free_.push_back(std::move(batch));
	}
}

size_t BatchPool::FreeCount() const {
	absl::MutexLock lock(&mutex_);
	return free_.size();
}

size_t BatchPool::AllocatedCount() const {
	absl::MutexLock lock(&mutex_);
	return allocated_;
}

}  // namespace Ftsb
