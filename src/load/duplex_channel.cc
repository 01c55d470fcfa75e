#include "duplex_channel.h"

#include <algorithm>

#include <glog/logging.h>

namespace Ftsb {

DuplexChannel::DuplexChannel(size_t capacity, size_t consumers)
	: capacity_(std::max<size_t>(capacity, 1)),
	  consumers_(std::max<size_t>(consumers, 1)),
	  to_worker_(capacity_),
	  to_scanner_(capacity_) {}

void DuplexChannel::ReclaimAcks() {
	bool ack;
	while (outstanding_.load(std::memory_order_relaxed) > 0 && to_scanner_.read(ack)) {
		outstanding_.fetch_sub(1, std::memory_order_acq_rel);
	}
	while (outstanding_.load(std::memory_order_relaxed) >= capacity_) {
		to_scanner_.blockingRead(ack);
		outstanding_.fetch_sub(1, std::memory_order_acq_rel);
	}
}

void DuplexChannel::Send(std::unique_ptr<Batch> batch) {
	if (closed_.load(std::memory_order_acquire)) {
		LOG(ERROR) << "DuplexChannel::Send after Close, dropping batch of " << batch->Len() << " records";
		return;
	}
	ReclaimAcks();

	size_t now = outstanding_.fetch_add(1, std::memory_order_acq_rel) + 1;
	size_t seen = high_watermark_.load(std::memory_order_relaxed);
	while (now > seen && !high_watermark_.compare_exchange_weak(seen, now, std::memory_order_acq_rel)) {
	}

	to_worker_.blockingWrite(std::move(batch));
}

bool DuplexChannel::Receive(std::unique_ptr<Batch>* batch) {
	WorkItem item;
	to_worker_.blockingRead(item);
	if (!item.has_value()) {
		// Close() sentinel: one per consumer, queued behind all real batches
		return false;
	}
	*batch = std::move(*item);
	return true;
}

void DuplexChannel::Ack() {
	to_scanner_.blockingWrite(true);
}

void DuplexChannel::Close() {
	if (closed_.exchange(true, std::memory_order_acq_rel)) {
		return;
	}
	VLOG(2) << "Closing channel with " << Outstanding() << " outstanding batches";
	for (size_t i = 0; i < consumers_; ++i) {
		to_worker_.blockingWrite(std::nullopt);
	}
}

}  // namespace Ftsb
