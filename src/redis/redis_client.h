#pragma once

/**
 * hiredis-backed clients that execute a list of commands as one pipelined
 * round trip per connection.
 */

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <hiredis/hiredis.h>

#include "key_slot.h"

namespace Ftsb {

// Command name followed by its arguments
using RedisCommand = std::vector<std::string>;

using RedisReplyPtr = std::unique_ptr<redisReply, decltype(&freeReplyObject)>;

/**
 * Executes pipelines against the target.
 */
class PipelineClient {
public:
	virtual ~PipelineClient() = default;

	/**
	 * Sends all commands and reads every reply.
	 * @param rx_bytes When non-null, resized to commands.size() and filled
	 *                 with the payload size of each reply
	 * @return false and sets *error when the round trip fails or any reply
	 *         is an error
	 */
	virtual bool Do(const std::vector<RedisCommand>& commands,
			std::vector<uint64_t>* rx_bytes, std::string* error) = 0;
};

/**
 * Splits "host:port". A missing port defaults to 6379.
 * @return false when the port is not a number in [1, 65535]
 */
bool ParseHostPort(const std::string& address, std::string* host, int* port);

/// Bytes of payload carried by a reply (strings, statuses, errors, nested arrays)
uint64_t ReplyPayloadSize(const redisReply* reply);

// Slots [first, last] served by the primary at `address`
struct SlotRange {
	int first;
	int last;
	std::string address;
};

/**
 * Reads the primaries out of a CLUSTER SLOTS reply. Replicas are ignored.
 * @param default_host Used for nodes announcing an empty address
 * @return false and sets *error on an error reply, a malformed entry or an
 *         empty slot map
 */
bool ParseClusterSlots(const redisReply* reply, const std::string& default_host,
		std::vector<SlotRange>* ranges, std::string* error);

/**
 * One hiredis connection.
 */
class RedisConnection {
public:
	/**
	 * @return nullptr and sets *error when the connection cannot be established
	 */
	static std::unique_ptr<RedisConnection> Connect(const std::string& host, int port, std::string* error);

	~RedisConnection();

	RedisConnection(const RedisConnection&) = delete;
	RedisConnection& operator=(const RedisConnection&) = delete;

	/**
	 * Appends every command, then reads the replies in order.
	 * @param replies Receives one reply per command; error replies included
	 * @return false only on I/O or protocol failure
	 */
	bool Pipeline(const std::vector<const RedisCommand*>& commands,
			std::vector<RedisReplyPtr>* replies, std::string* error);

	// Single command round trip; nullptr on I/O failure
	RedisReplyPtr Execute(const RedisCommand& command, std::string* error);

	const std::string& address() const { return address_; }

private:
	RedisConnection(redisContext* context, std::string address)
		: context_(context), address_(std::move(address)) {}

	redisContext* context_;
	std::string address_;

	bool EnsureConnected(std::string* error);
};

/**
 * One node of the target as seen by the cluster client.
 */
class NodeClient {
public:
	virtual ~NodeClient() = default;

	/**
	 * Runs the commands at the given positions only. Replies land at the same
	 * positions of *replies, which must already hold commands.size() entries.
	 * @return false only on I/O or protocol failure
	 */
	virtual bool DoSubset(const std::vector<RedisCommand>& commands, const std::vector<size_t>& positions,
			std::vector<RedisReplyPtr>* replies, std::string* error) = 0;
};

// Opens `pool_size` connections to `address`; nullptr and *error on failure
using NodeClientFactory = std::function<std::unique_ptr<NodeClient>(
		const std::string& address, size_t pool_size, std::string* error)>;

/**
 * Fixed pool of connections to a single node, used round-robin: each Do()
 * goes through the next connection.
 */
class RedisPoolClient : public PipelineClient, public NodeClient {
public:
	/**
	 * Connects every pooled connection.
	 * @return nullptr and sets *error on an invalid address or connect failure
	 */
	static std::unique_ptr<RedisPoolClient> Open(const std::string& address, size_t pool_size, std::string* error);

	bool Do(const std::vector<RedisCommand>& commands,
			std::vector<uint64_t>* rx_bytes, std::string* error) override;

	bool DoSubset(const std::vector<RedisCommand>& commands, const std::vector<size_t>& positions,
			std::vector<RedisReplyPtr>* replies, std::string* error) override;

	size_t pool_size() const { return connections_.size(); }

private:
	RedisPoolClient(std::string address, std::vector<std::unique_ptr<RedisConnection>> connections)
		: address_(std::move(address)), connections_(std::move(connections)) {}

	std::string address_;
	std::vector<std::unique_ptr<RedisConnection>> connections_;
	std::atomic<size_t> next_{0};
};

// NodeClientFactory backed by RedisPoolClient::Open
std::unique_ptr<NodeClient> DefaultNodeClientFactory(const std::string& address, size_t pool_size,
		std::string* error);

/**
 * Cluster-aware client. Reads the slot map with CLUSTER SLOTS, routes each
 * command by the slot of its first argument and sends one pipeline per node.
 * A MOVED/ASK reply marks the slot map stale; it is reloaded before the next
 * round trip.
 */
class RedisClusterClient : public PipelineClient {
public:
	/**
	 * Nothing is contacted until LoadSlots().
	 * @param seed Any node of the cluster
	 * @param pool_size Connections per node
	 */
	RedisClusterClient(std::string seed, size_t pool_size,
			NodeClientFactory factory = DefaultNodeClientFactory);

	/**
	 * Asks the seed for CLUSTER SLOTS and connects to any new primary. The
	 * current map is kept when this fails.
	 */
	bool LoadSlots(std::string* error);

	bool Do(const std::vector<RedisCommand>& commands,
			std::vector<uint64_t>* rx_bytes, std::string* error) override;

	size_t node_count() const { return nodes_.size(); }
	bool stale() const { return stale_; }

private:
	std::string seed_;
	size_t pool_size_;
	NodeClientFactory factory_;
	std::map<std::string, std::unique_ptr<NodeClient>> nodes_;
	// Owning node of every slot; nullptr for unassigned slots
	std::array<NodeClient*, kClusterSlots> slots_{};
	bool stale_ = true;

	NodeClient* NodeFor(const RedisCommand& command);
};

/**
 * Pool or cluster client for `address`, connecting `pool_size` connections
 * per node. Failing to connect or to load the slot map is fatal.
 */
std::unique_ptr<PipelineClient> NewPipelineClient(const std::string& address, size_t pool_size, bool cluster_mode);

}  // namespace Ftsb
