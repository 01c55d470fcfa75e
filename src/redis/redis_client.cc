#include "redis_client.h"

#include <glog/logging.h>

namespace Ftsb {

namespace {

constexpr int kDefaultRedisPort = 6379;

bool IsRedirect(const redisReply* reply) {
	if (reply == nullptr || reply->type != REDIS_REPLY_ERROR || reply->str == nullptr) {
		return false;
	}
	std::string message(reply->str, reply->len);
	return message.rfind("MOVED ", 0) == 0 || message.rfind("ASK ", 0) == 0;
}

// Fails on the first error reply; fills rx_bytes when requested
bool CollectReplies(const std::vector<RedisReplyPtr>& replies, std::vector<uint64_t>* rx_bytes,
		std::string* error) {
	if (rx_bytes) {
		rx_bytes->assign(replies.size(), 0);
	}
	for (size_t i = 0; i < replies.size(); ++i) {
		const redisReply* reply = replies[i].get();
		if (reply == nullptr) {
			*error = "missing reply for command " + std::to_string(i);
			return false;
		}
		if (reply->type == REDIS_REPLY_ERROR) {
			*error = std::string(reply->str, reply->len);
			return false;
		}
		if (rx_bytes) {
			(*rx_bytes)[i] = ReplyPayloadSize(reply);
		}
	}
	return true;
}

std::vector<RedisReplyPtr> EmptyReplies(size_t n) {
	std::vector<RedisReplyPtr> replies;
	replies.reserve(n);
	for (size_t i = 0; i < n; ++i) {
		replies.emplace_back(nullptr, &freeReplyObject);
	}
	return replies;
}

}  // namespace

bool ParseHostPort(const std::string& address, std::string* host, int* port) {
	size_t colon = address.rfind(':');
	if (colon == std::string::npos) {
		*host = address;
		*port = kDefaultRedisPort;
		return !host->empty();
	}
	*host = address.substr(0, colon);
	std::string port_str = address.substr(colon + 1);
	if (host->empty() || port_str.empty() ||
			port_str.find_first_not_of("0123456789") != std::string::npos || port_str.size() > 5) {
		return false;
	}
	*port = std::stoi(port_str);
	return *port >= 1 && *port <= 65535;
}

uint64_t ReplyPayloadSize(const redisReply* reply) {
	if (reply == nullptr) {
		return 0;
	}
	switch (reply->type) {
		case REDIS_REPLY_STRING:
		case REDIS_REPLY_STATUS:
		case REDIS_REPLY_ERROR:
		case REDIS_REPLY_VERB:
		case REDIS_REPLY_DOUBLE:
			return reply->len;
		case REDIS_REPLY_INTEGER:
			return std::to_string(reply->integer).size();
		case REDIS_REPLY_ARRAY:
		case REDIS_REPLY_MAP:
		case REDIS_REPLY_SET: {
			uint64_t total = 0;
			for (size_t i = 0; i < reply->elements; ++i) {
				total += ReplyPayloadSize(reply->element[i]);
			}
			return total;
		}
		default:
			return 0;
	}
}

// --- RedisConnection ---

std::unique_ptr<RedisConnection> RedisConnection::Connect(const std::string& host, int port, std::string* error) {
	redisContext* context = redisConnect(host.c_str(), port);
	std::string address = host + ":" + std::to_string(port);
	if (context == nullptr) {
		*error = "cannot allocate redis context for " + address;
		return nullptr;
	}
	if (context->err) {
		*error = address + ": " + context->errstr;
		redisFree(context);
		return nullptr;
	}
	return std::unique_ptr<RedisConnection>(new RedisConnection(context, std::move(address)));
}

RedisConnection::~RedisConnection() {
	if (context_) {
		redisFree(context_);
	}
}

bool RedisConnection::EnsureConnected(std::string* error) {
	if (!context_->err) {
		return true;
	}
	LOG(WARNING) << "Reconnecting to " << address_ << " after: " << context_->errstr;
	if (redisReconnect(context_) != REDIS_OK) {
		*error = address_ + ": " + context_->errstr;
		return false;
	}
	return true;
}

bool RedisConnection::Pipeline(const std::vector<const RedisCommand*>& commands,
		std::vector<RedisReplyPtr>* replies, std::string* error) {
	replies->clear();
	if (!EnsureConnected(error)) {
		return false;
	}

	std::vector<const char*> argv;
	std::vector<size_t> argv_len;
	for (const RedisCommand* command : commands) {
		argv.clear();
		argv_len.clear();
		for (const std::string& arg : *command) {
			argv.push_back(arg.data());
			argv_len.push_back(arg.size());
		}
		if (redisAppendCommandArgv(context_, static_cast<int>(argv.size()), argv.data(), argv_len.data()) != REDIS_OK) {
			*error = address_ + ": " + context_->errstr;
			return false;
		}
	}

	replies->reserve(commands.size());
	for (size_t i = 0; i < commands.size(); ++i) {
		void* raw = nullptr;
		if (redisGetReply(context_, &raw) != REDIS_OK) {
			*error = address_ + ": " + context_->errstr;
			return false;
		}
		replies->emplace_back(static_cast<redisReply*>(raw), &freeReplyObject);
	}
	return true;
}

RedisReplyPtr RedisConnection::Execute(const RedisCommand& command, std::string* error) {
	std::vector<RedisReplyPtr> replies;
	if (!Pipeline({&command}, &replies, error)) {
		return RedisReplyPtr(nullptr, &freeReplyObject);
	}
	return std::move(replies.front());
}

// --- RedisPoolClient ---

std::unique_ptr<RedisPoolClient> RedisPoolClient::Open(const std::string& address, size_t pool_size,
		std::string* error) {
	std::string host;
	int port = 0;
	if (!ParseHostPort(address, &host, &port)) {
		*error = "invalid redis address \"" + address + "\"";
		return nullptr;
	}
	if (pool_size == 0) {
		pool_size = 1;
	}
	std::vector<std::unique_ptr<RedisConnection>> connections;
	for (size_t i = 0; i < pool_size; ++i) {
		auto connection = RedisConnection::Connect(host, port, error);
		if (!connection) {
			return nullptr;
		}
		connections.push_back(std::move(connection));
	}
	VLOG(2) << "Opened " << pool_size << " connections to " << address;
	return std::unique_ptr<RedisPoolClient>(new RedisPoolClient(address, std::move(connections)));
}

bool RedisPoolClient::DoSubset(const std::vector<RedisCommand>& commands, const std::vector<size_t>& positions,
		std::vector<RedisReplyPtr>* replies, std::string* error) {
	if (positions.empty()) {
		return true;
	}
	RedisConnection& connection = *connections_[next_.fetch_add(1, std::memory_order_relaxed) % connections_.size()];

	std::vector<const RedisCommand*> subset;
	subset.reserve(positions.size());
	for (size_t pos : positions) {
		subset.push_back(&commands[pos]);
	}

	std::vector<RedisReplyPtr> out;
	if (!connection.Pipeline(subset, &out, error)) {
		return false;
	}
	for (size_t i = 0; i < positions.size(); ++i) {
		(*replies)[positions[i]] = std::move(out[i]);
	}
	return true;
}

bool RedisPoolClient::Do(const std::vector<RedisCommand>& commands,
		std::vector<uint64_t>* rx_bytes, std::string* error) {
	std::vector<size_t> positions(commands.size());
	for (size_t i = 0; i < positions.size(); ++i) {
		positions[i] = i;
	}
	std::vector<RedisReplyPtr> replies = EmptyReplies(commands.size());
	if (!DoSubset(commands, positions, &replies, error)) {
		return false;
	}
	return CollectReplies(replies, rx_bytes, error);
}

std::unique_ptr<NodeClient> DefaultNodeClientFactory(const std::string& address, size_t pool_size,
		std::string* error) {
	return RedisPoolClient::Open(address, pool_size, error);
}

// --- Cluster slot map ---

bool ParseClusterSlots(const redisReply* reply, const std::string& default_host,
		std::vector<SlotRange>* ranges, std::string* error) {
	ranges->clear();
	if (reply == nullptr) {
		*error = "no CLUSTER SLOTS reply";
		return false;
	}
	if (reply->type != REDIS_REPLY_ARRAY) {
		*error = "unexpected CLUSTER SLOTS reply";
		if (reply->type == REDIS_REPLY_ERROR && reply->str != nullptr) {
			*error += ": " + std::string(reply->str, reply->len);
		}
		return false;
	}

	for (size_t i = 0; i < reply->elements; ++i) {
		const std::string entry = "malformed CLUSTER SLOTS entry " + std::to_string(i);
		const redisReply* range = reply->element[i];
		if (range == nullptr || range->type != REDIS_REPLY_ARRAY || range->elements < 3 ||
				range->element[0] == nullptr || range->element[0]->type != REDIS_REPLY_INTEGER ||
				range->element[1] == nullptr || range->element[1]->type != REDIS_REPLY_INTEGER ||
				range->element[2] == nullptr || range->element[2]->type != REDIS_REPLY_ARRAY ||
				range->element[2]->elements < 2) {
			*error = entry;
			return false;
		}
		long long first = range->element[0]->integer;
		long long last = range->element[1]->integer;
		if (first < 0 || last >= kClusterSlots || first > last) {
			*error = entry + ": slot range " + std::to_string(first) + "-" + std::to_string(last);
			return false;
		}

		const redisReply* primary = range->element[2];
		const redisReply* host_reply = primary->element[0];
		const redisReply* port_reply = primary->element[1];
		if (host_reply == nullptr || host_reply->type != REDIS_REPLY_STRING ||
				port_reply == nullptr || port_reply->type != REDIS_REPLY_INTEGER) {
			*error = entry + ": primary is not a host/port pair";
			return false;
		}
		if (port_reply->integer < 1 || port_reply->integer > 65535) {
			*error = entry + ": port " + std::to_string(port_reply->integer);
			return false;
		}
		std::string host = host_reply->str != nullptr ? std::string(host_reply->str, host_reply->len) : "";
		// Nodes may announce an empty address for themselves
		if (host.empty()) {
			host = default_host;
		}
		ranges->push_back({static_cast<int>(first), static_cast<int>(last),
				host + ":" + std::to_string(port_reply->integer)});
	}
	if (ranges->empty()) {
		*error = "cluster has no slots assigned";
		return false;
	}
	return true;
}

// --- RedisClusterClient ---

RedisClusterClient::RedisClusterClient(std::string seed, size_t pool_size, NodeClientFactory factory)
	: seed_(std::move(seed)), pool_size_(pool_size), factory_(std::move(factory)) {}

bool RedisClusterClient::LoadSlots(std::string* error) {
	std::string seed_host;
	int seed_port = 0;
	if (!ParseHostPort(seed_, &seed_host, &seed_port)) {
		*error = "invalid seed address \"" + seed_ + "\"";
		return false;
	}

	std::unique_ptr<NodeClient> seed = factory_(seed_, 1, error);
	if (!seed) {
		return false;
	}
	const std::vector<RedisCommand> query = {{"CLUSTER", "SLOTS"}};
	std::vector<RedisReplyPtr> replies = EmptyReplies(1);
	if (!seed->DoSubset(query, {0}, &replies, error)) {
		return false;
	}
	std::vector<SlotRange> ranges;
	if (!ParseClusterSlots(replies[0].get(), seed_host, &ranges, error)) {
		return false;
	}

	// Build the new map aside so a failed connect leaves the current one usable
	std::map<std::string, std::unique_ptr<NodeClient>> nodes;
	for (const SlotRange& range : ranges) {
		if (nodes.count(range.address)) {
			continue;
		}
		auto existing = nodes_.find(range.address);
		if (existing != nodes_.end()) {
			nodes.emplace(range.address, std::move(existing->second));
			nodes_.erase(existing);
			continue;
		}
		std::unique_ptr<NodeClient> node = factory_(range.address, pool_size_, error);
		if (!node) {
			*error = "cannot connect to cluster node " + range.address + ": " + *error;
			for (auto& [address, kept] : nodes) {
				nodes_.emplace(address, std::move(kept));
			}
			return false;
		}
		nodes.emplace(range.address, std::move(node));
	}

	nodes_ = std::move(nodes);
	slots_.fill(nullptr);
	for (const SlotRange& range : ranges) {
		NodeClient* node = nodes_.at(range.address).get();
		for (int slot = range.first; slot <= range.last; ++slot) {
			slots_[slot] = node;
		}
	}
	stale_ = false;
	VLOG(1) << "Cluster slot map loaded from " << seed_ << ": " << nodes_.size() << " primaries";
	return true;
}

NodeClient* RedisClusterClient::NodeFor(const RedisCommand& command) {
	if (command.size() < 2) {
		return nodes_.begin()->second.get();
	}
	return slots_[KeyHashSlot(command[1])];
}

bool RedisClusterClient::Do(const std::vector<RedisCommand>& commands,
		std::vector<uint64_t>* rx_bytes, std::string* error) {
	if (stale_) {
		VLOG(1) << "Reloading cluster slot map";
		if (!LoadSlots(error)) {
			return false;
		}
	}

	std::map<NodeClient*, std::vector<size_t>> by_node;
	for (size_t i = 0; i < commands.size(); ++i) {
		NodeClient* node = NodeFor(commands[i]);
		if (node == nullptr) {
			*error = "no node serves slot " + std::to_string(KeyHashSlot(commands[i][1]));
			stale_ = true;
			return false;
		}
		by_node[node].push_back(i);
	}

	std::vector<RedisReplyPtr> replies = EmptyReplies(commands.size());
	for (auto& [node, positions] : by_node) {
		if (!node->DoSubset(commands, positions, &replies, error)) {
			return false;
		}
	}
	for (const RedisReplyPtr& reply : replies) {
		if (IsRedirect(reply.get())) {
			stale_ = true;
			break;
		}
	}
	return CollectReplies(replies, rx_bytes, error);
}

std::unique_ptr<PipelineClient> NewPipelineClient(const std::string& address, size_t pool_size, bool cluster_mode) {
	std::string error;
	if (cluster_mode) {
		auto cluster = std::make_unique<RedisClusterClient>(address, pool_size);
		if (!cluster->LoadSlots(&error)) {
			LOG(FATAL) << "Error preparing for benchmark, while creating new cluster connection: " << error;
		}
		LOG(INFO) << "Cluster slot map loaded from " << address << ": " << cluster->node_count() << " primaries";
		return cluster;
	}
	auto pool = RedisPoolClient::Open(address, pool_size, &error);
	if (!pool) {
		LOG(FATAL) << "Error preparing for benchmark, while creating new connection pool: " << error;
	}
	return pool;
}

}  // namespace Ftsb
