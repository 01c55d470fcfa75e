#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "absl/synchronization/mutex.h"

#include "record.h"

namespace Ftsb {

/**
 * Ordered group of records bound for one partition.
 */
class Batch {
public:
	explicit Batch(size_t capacity_hint = 0) { records_.reserve(capacity_hint); }

	void Append(Record&& record) { records_.push_back(std::move(record)); }
	size_t Len() const { return records_.size(); }
	bool Empty() const { return records_.empty(); }

	const std::vector<Record>& records() const { return records_; }

	// Drops the records but keeps the allocation for reuse
	void Clear() { records_.clear(); }

private:
	std::vector<Record> records_;
};

/**
 * Free list of batches. Acquire() hands out exclusive ownership; Release()
 * takes it back, so a recycled batch cannot be reached from its last user.
 * Thread-safe: the scanner acquires while workers release.
 */
class BatchPool {
public:
	/**
	 * @param batch_size Capacity reserved in newly allocated batches
	 * @param max_free Number of idle batches kept; extras are freed
	 */
	explicit BatchPool(size_t batch_size, size_t max_free = 1024)
		: batch_size_(batch_size), max_free_(max_free) {}

	std::unique_ptr<Batch> Acquire();
	void Release(std::unique_ptr<Batch> batch);

	size_t FreeCount() const;
	size_t AllocatedCount() const;

private:
	const size_t batch_size_;
	const size_t max_free_;
	mutable absl::Mutex mutex_;
	std::vector<std::unique_ptr<Batch>> free_ ABSL_GUARDED_BY(mutex_);
	size_t allocated_ ABSL_GUARDED_BY(mutex_) = 0;
};

}  // namespace Ftsb
