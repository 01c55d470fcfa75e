#pragma once

#include <cstdint>

#include "record.h"

namespace Ftsb {

/**
 * Chooses the partition a record is routed to.
 */
class RecordIndexer {
public:
	virtual ~RecordIndexer() = default;

	/**
	 * @param items_read Records read before this one
	 * @return Partition in [0, partitions)
	 */
	virtual unsigned GetIndex(uint64_t items_read, const Record& record) = 0;
};

/**
 * Round-robin on the record's position in the stream, so the assignment only
 * depends on the input order and the partition count.
 */
class ModuloIndexer : public RecordIndexer {
public:
	explicit ModuloIndexer(unsigned partitions) : partitions_(partitions == 0 ? 1 : partitions) {}

	unsigned GetIndex(uint64_t items_read, const Record&) override {
		return static_cast<unsigned>(items_read % partitions_);
	}

private:
	unsigned partitions_;
};

}  // namespace Ftsb
