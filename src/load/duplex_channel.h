#pragma once

/**
 * DuplexChannel: bounded batch queue from the scanner to the workers plus an
 * acknowledgment queue back.
 *
 * The scanner may have at most `capacity` batches sent but not yet
 * acknowledged; Send() blocks until a worker acknowledges one. Several
 * workers may consume from the same channel.
 *
 * @threading Single producer (Send/Close); any number of consumers (Receive/Ack).
 */

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>

#include "folly/MPMCQueue.h"

#include "batch.h"

namespace Ftsb {

class DuplexChannel {
public:
	/**
	 * @param capacity Maximum number of unacknowledged batches
	 * @param consumers Number of workers that will call Receive() on this channel
	 */
	DuplexChannel(size_t capacity, size_t consumers);

	DuplexChannel(const DuplexChannel&) = delete;
	DuplexChannel& operator=(const DuplexChannel&) = delete;

	/**
	 * Hands a batch to the workers. Blocks while `capacity` batches are
	 * outstanding.
	 */
	void Send(std::unique_ptr<Batch> batch);

	/**
	 * Blocks until a batch is available.
	 * @return false once the channel is closed and every queued batch was taken
	 */
	bool Receive(std::unique_ptr<Batch>* batch);

	/**
	 * Signals that one received batch is done, freeing one slot.
	 */
	void Ack();

	/**
	 * No more Send(). Queued batches remain receivable. Only the first call
	 * has an effect.
	 */
	void Close();

	size_t capacity() const { return capacity_; }
	size_t consumers() const { return consumers_; }

	// Batches sent and not yet acknowledged, as seen by the producer
	size_t Outstanding() const { return outstanding_.load(std::memory_order_acquire); }
	// Largest Outstanding() ever reached
	size_t HighWatermark() const { return high_watermark_.load(std::memory_order_acquire); }

private:
	using WorkItem = std::optional<std::unique_ptr<Batch>>;

	const size_t capacity_;
	const size_t consumers_;
	folly::MPMCQueue<WorkItem> to_worker_;
	folly::MPMCQueue<bool> to_scanner_;

	std::atomic<size_t> outstanding_{0};
	std::atomic<size_t> high_watermark_{0};
	std::atomic<bool> closed_{false};

	void ReclaimAcks();
};

}  // namespace Ftsb
