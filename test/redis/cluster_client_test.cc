#include <gtest/gtest.h>

#include <cstdlib>
#include <cstring>
#include <map>
#include <set>

#include "../../src/redis/redis_client.h"

using namespace Ftsb;

namespace {

// Heap-allocated replies, released by freeReplyObject like hiredis' own
redisReply* NewReply(int type) {
    auto* reply = static_cast<redisReply*>(calloc(1, sizeof(redisReply)));
    reply->type = type;
    return reply;
}

redisReply* NewString(int type, const std::string& value) {
    redisReply* reply = NewReply(type);
    reply->str = static_cast<char*>(malloc(value.size() + 1));
    memcpy(reply->str, value.c_str(), value.size() + 1);
    reply->len = value.size();
    return reply;
}

redisReply* NewInteger(long long value) {
    redisReply* reply = NewReply(REDIS_REPLY_INTEGER);
    reply->integer = value;
    return reply;
}

redisReply* NewArray(const std::vector<redisReply*>& items) {
    redisReply* reply = NewReply(REDIS_REPLY_ARRAY);
    reply->elements = items.size();
    reply->element = static_cast<redisReply**>(calloc(items.size() + 1, sizeof(redisReply*)));
    for (size_t i = 0; i < items.size(); ++i) {
        reply->element[i] = items[i];
    }
    return reply;
}

// [first, last, [host, port, id]]
redisReply* NewSlotEntry(long long first, long long last, const std::string& host, long long port) {
    return NewArray({NewInteger(first), NewInteger(last),
        NewArray({NewString(REDIS_REPLY_STRING, host), NewInteger(port),
            NewString(REDIS_REPLY_STRING, "node-id")})});
}

RedisReplyPtr Own(redisReply* reply) {
    return RedisReplyPtr(reply, &freeReplyObject);
}

struct Primary {
    int first;
    int last;
    std::string host;
    int port;
};

// Shared state behind every FakeNode handed out by the factory
struct FakeCluster {
    std::vector<Primary> primaries;
    std::set<std::string> unreachable;
    std::set<std::string> redirecting;
    std::map<std::string, std::vector<std::string>> keys_by_node;
    int slot_queries = 0;
    int connects = 0;

    redisReply* SlotsReply() const {
        std::vector<redisReply*> entries;
        for (const Primary& p : primaries) {
            entries.push_back(NewSlotEntry(p.first, p.last, p.host, p.port));
        }
        return NewArray(entries);
    }
};

// Answers CLUSTER SLOTS from the shared map and every other command with a
// bulk string holding its key
class FakeNode : public NodeClient {
public:
    FakeNode(FakeCluster* cluster, std::string address)
        : cluster_(cluster), address_(std::move(address)) {}

    bool DoSubset(const std::vector<RedisCommand>& commands, const std::vector<size_t>& positions,
            std::vector<RedisReplyPtr>* replies, std::string* error) override {
        for (size_t pos : positions) {
            const RedisCommand& command = commands[pos];
            redisReply* reply;
            if (command[0] == "CLUSTER") {
                ++cluster_->slot_queries;
                reply = cluster_->SlotsReply();
            } else if (cluster_->redirecting.count(address_)) {
                reply = NewString(REDIS_REPLY_ERROR, "MOVED 8620 10.0.0.9:7009");
            } else {
                cluster_->keys_by_node[address_].push_back(command[1]);
                reply = NewString(REDIS_REPLY_STRING, command[1]);
            }
            (*replies)[pos] = Own(reply);
        }
        return true;
    }

private:
    FakeCluster* cluster_;
    std::string address_;
};

const std::string kNodeA = "10.0.0.1:7000";
const std::string kNodeB = "10.0.0.2:7001";

}  // namespace

TEST(ParseClusterSlotsTest, ReadsPrimaries) {
    RedisReplyPtr reply = Own(NewArray({
        NewSlotEntry(0, 8191, "10.0.0.1", 7000),
        // Trailing replica is ignored
        NewArray({NewInteger(8192), NewInteger(16383),
            NewArray({NewString(REDIS_REPLY_STRING, ""), NewInteger(7001)}),
            NewArray({NewString(REDIS_REPLY_STRING, "10.0.0.3"), NewInteger(7002)})}),
    }));

    std::vector<SlotRange> ranges;
    std::string error;
    ASSERT_TRUE(ParseClusterSlots(reply.get(), "seed-host", &ranges, &error)) << error;
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[0].first, 0);
    EXPECT_EQ(ranges[0].last, 8191);
    EXPECT_EQ(ranges[0].address, "10.0.0.1:7000");
    EXPECT_EQ(ranges[1].first, 8192);
    EXPECT_EQ(ranges[1].last, 16383);
    // Empty announced host falls back to the seed host
    EXPECT_EQ(ranges[1].address, "seed-host:7001");
}

TEST(ParseClusterSlotsTest, RejectsMalformedEntries) {
    std::vector<SlotRange> ranges;
    std::string error;

    // Port announced as a string
    RedisReplyPtr string_port = Own(NewArray({NewArray({NewInteger(0), NewInteger(16383),
        NewArray({NewString(REDIS_REPLY_STRING, "10.0.0.1"), NewString(REDIS_REPLY_STRING, "7000")})})}));
    EXPECT_FALSE(ParseClusterSlots(string_port.get(), "seed", &ranges, &error));
    EXPECT_NE(error.find("entry 0"), std::string::npos);

    // Host announced as an integer
    RedisReplyPtr integer_host = Own(NewArray({NewArray({NewInteger(0), NewInteger(16383),
        NewArray({NewInteger(1), NewInteger(7000)})})}));
    EXPECT_FALSE(ParseClusterSlots(integer_host.get(), "seed", &ranges, &error));

    RedisReplyPtr zero_port = Own(NewArray({NewSlotEntry(0, 16383, "10.0.0.1", 0)}));
    EXPECT_FALSE(ParseClusterSlots(zero_port.get(), "seed", &ranges, &error));

    RedisReplyPtr out_of_range = Own(NewArray({NewSlotEntry(0, 16384, "10.0.0.1", 7000)}));
    EXPECT_FALSE(ParseClusterSlots(out_of_range.get(), "seed", &ranges, &error));

    RedisReplyPtr reversed = Own(NewArray({NewSlotEntry(200, 100, "10.0.0.1", 7000)}));
    EXPECT_FALSE(ParseClusterSlots(reversed.get(), "seed", &ranges, &error));

    RedisReplyPtr short_entry = Own(NewArray({NewArray({NewInteger(0), NewInteger(16383)})}));
    EXPECT_FALSE(ParseClusterSlots(short_entry.get(), "seed", &ranges, &error));

    RedisReplyPtr empty = Own(NewArray({}));
    EXPECT_FALSE(ParseClusterSlots(empty.get(), "seed", &ranges, &error));
    EXPECT_EQ(error, "cluster has no slots assigned");

    RedisReplyPtr disabled = Own(NewString(REDIS_REPLY_ERROR, "ERR This instance has cluster support disabled"));
    EXPECT_FALSE(ParseClusterSlots(disabled.get(), "seed", &ranges, &error));
    EXPECT_NE(error.find("cluster support disabled"), std::string::npos);

    EXPECT_FALSE(ParseClusterSlots(nullptr, "seed", &ranges, &error));
}

class RedisClusterClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        cluster_.primaries = {{0, 8191, "10.0.0.1", 7000}, {8192, 16383, "10.0.0.2", 7001}};
        client_ = std::make_unique<RedisClusterClient>(kNodeA, 2,
            [this](const std::string& address, size_t, std::string* error) -> std::unique_ptr<NodeClient> {
                if (cluster_.unreachable.count(address)) {
                    *error = "Connection refused";
                    return nullptr;
                }
                ++cluster_.connects;
                return std::make_unique<FakeNode>(&cluster_, address);
            });
    }

    // Keys hash to slots 135, 15495, 4112, 8620 and 16196
    std::vector<RedisCommand> Commands() const {
        return {{"HSET", "ccc", "f", "v"}, {"HSET", "a", "f", "v"}, {"HSET", "doc:22", "f", "v"},
            {"HSET", "bb", "f", "v"}, {"HSET", "dddd", "f", "v"}};
    }

    FakeCluster cluster_;
    std::unique_ptr<RedisClusterClient> client_;
};

TEST_F(RedisClusterClientTest, RoutesBySlotAndKeepsReplyOrder) {
    std::string error;
    ASSERT_TRUE(client_->LoadSlots(&error)) << error;
    EXPECT_EQ(client_->node_count(), 2u);
    EXPECT_FALSE(client_->stale());

    std::vector<uint64_t> rx_bytes;
    ASSERT_TRUE(client_->Do(Commands(), &rx_bytes, &error)) << error;

    // Each reply echoes its key, so sizes follow command order
    EXPECT_EQ(rx_bytes, (std::vector<uint64_t>{3, 1, 6, 2, 4}));
    EXPECT_EQ(cluster_.keys_by_node[kNodeA], (std::vector<std::string>{"ccc", "doc:22"}));
    EXPECT_EQ(cluster_.keys_by_node[kNodeB], (std::vector<std::string>{"a", "bb", "dddd"}));
    EXPECT_EQ(cluster_.slot_queries, 1);
}

TEST_F(RedisClusterClientTest, FirstDoLoadsSlotMap) {
    std::string error;
    EXPECT_TRUE(client_->stale());
    ASSERT_TRUE(client_->Do(Commands(), nullptr, &error)) << error;
    EXPECT_EQ(cluster_.slot_queries, 1);
    EXPECT_EQ(client_->node_count(), 2u);
}

TEST_F(RedisClusterClientTest, RedirectMarksMapStaleAndReloads) {
    std::string error;
    ASSERT_TRUE(client_->LoadSlots(&error)) << error;

    cluster_.redirecting.insert(kNodeB);
    EXPECT_FALSE(client_->Do(Commands(), nullptr, &error));
    EXPECT_EQ(error.rfind("MOVED", 0), 0u);
    EXPECT_TRUE(client_->stale());

    // The map now hands every slot to node A
    cluster_.redirecting.clear();
    cluster_.primaries = {{0, 16383, "10.0.0.1", 7000}};
    cluster_.keys_by_node.clear();
    ASSERT_TRUE(client_->Do(Commands(), nullptr, &error)) << error;
    EXPECT_FALSE(client_->stale());
    EXPECT_EQ(cluster_.slot_queries, 2);
    EXPECT_EQ(client_->node_count(), 1u);
    EXPECT_EQ(cluster_.keys_by_node[kNodeA].size(), 5u);
    EXPECT_TRUE(cluster_.keys_by_node[kNodeB].empty());
}

TEST_F(RedisClusterClientTest, UnreachableNewNodeFailsReloadWithoutDying) {
    std::string error;
    ASSERT_TRUE(client_->LoadSlots(&error)) << error;
    int connects = cluster_.connects;

    cluster_.redirecting.insert(kNodeB);
    EXPECT_FALSE(client_->Do(Commands(), nullptr, &error));
    cluster_.redirecting.clear();

    cluster_.primaries = {{0, 8191, "10.0.0.1", 7000}, {8192, 16383, "10.0.0.3", 7002}};
    cluster_.unreachable.insert("10.0.0.3:7002");
    EXPECT_FALSE(client_->Do(Commands(), nullptr, &error));
    EXPECT_NE(error.find("10.0.0.3:7002"), std::string::npos);
    EXPECT_TRUE(client_->stale());
    // Existing connections survive the failed reload
    EXPECT_EQ(client_->node_count(), 2u);

    // Once the node is reachable the next round trip goes through
    cluster_.unreachable.clear();
    cluster_.keys_by_node.clear();
    ASSERT_TRUE(client_->Do(Commands(), nullptr, &error)) << error;
    EXPECT_EQ(cluster_.keys_by_node["10.0.0.3:7002"], (std::vector<std::string>{"a", "bb", "dddd"}));
    EXPECT_EQ(cluster_.keys_by_node[kNodeA], (std::vector<std::string>{"ccc", "doc:22"}));
    // Two seed queries and the new node; node A's pool was reused
    EXPECT_EQ(cluster_.connects, connects + 3);
}

TEST_F(RedisClusterClientTest, MalformedSlotMapIsAnError) {
    cluster_.primaries = {{0, 16383, "10.0.0.1", 0}};
    std::string error;
    EXPECT_FALSE(client_->LoadSlots(&error));
    EXPECT_NE(error.find("malformed CLUSTER SLOTS entry 0"), std::string::npos);
    EXPECT_EQ(client_->node_count(), 0u);

    cluster_.unreachable.insert(kNodeA);
    EXPECT_FALSE(client_->LoadSlots(&error));
    EXPECT_EQ(error, "Connection refused");
}
