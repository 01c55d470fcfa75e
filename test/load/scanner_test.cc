#include <gtest/gtest.h>
#include "../../src/load/scanner.h"

#include <map>
#include <mutex>
#include <sstream>
#include <thread>

using namespace Ftsb;

class ScannerTest : public ::testing::Test {
protected:
    struct Received {
        std::vector<std::string> ids;
        std::vector<size_t> batch_sizes;
    };

    // Scans `records` lines into `partitions` channels drained by one consumer each
    std::vector<Received> Run(int records, unsigned partitions, size_t batch_size, uint64_t limit,
            uint64_t* scanned) {
        std::ostringstream input;
        for (int i = 0; i < records; ++i) {
            input << "WRITE," << i << ",HSET,doc:" << i << ",f,v\n";
        }
        std::istringstream in(input.str());

        std::vector<std::unique_ptr<DuplexChannel>> channels;
        std::vector<DuplexChannel*> ptrs;
        for (unsigned p = 0; p < partitions; ++p) {
            channels.push_back(std::make_unique<DuplexChannel>(2, 1));
            ptrs.push_back(channels.back().get());
        }

        BatchPool pool(batch_size);
        std::vector<Received> received(partitions);
        std::vector<std::thread> consumers;
        for (unsigned p = 0; p < partitions; ++p) {
            consumers.emplace_back([&, p] {
                std::unique_ptr<Batch> batch;
                while (channels[p]->Receive(&batch)) {
                    received[p].batch_sizes.push_back(batch->Len());
                    for (const Record& r : batch->records()) {
                        received[p].ids.push_back(r.id);
                    }
                    pool.Release(std::move(batch));
                    channels[p]->Ack();
                }
            });
        }

        CsvRecordDecoder decoder(in);
        ModuloIndexer indexer(partitions);
        Scanner scanner(ptrs, pool);
        *scanned = scanner.Scan(decoder, indexer, batch_size, limit);
        batches_sent_ = scanner.batches_sent();
        for (auto& c : consumers) {
            c.join();
        }
        return received;
    }

    uint64_t batches_sent_ = 0;
};

TEST_F(ScannerTest, NoLossNoDuplication) {
    uint64_t scanned = 0;
    auto received = Run(1003, 4, 10, 0, &scanned);
    EXPECT_EQ(scanned, 1003u);

    std::map<std::string, int> seen;
    for (const auto& partition : received) {
        for (const auto& id : partition.ids) {
            seen[id]++;
        }
    }
    ASSERT_EQ(seen.size(), 1003u);
    for (const auto& [id, count] : seen) {
        EXPECT_EQ(count, 1) << id;
    }
}

TEST_F(ScannerTest, PartitionAssignmentFollowsStreamPosition) {
    uint64_t scanned = 0;
    auto received = Run(200, 3, 7, 0, &scanned);
    for (unsigned p = 0; p < 3; ++p) {
        // In order, and only records whose position maps to p
        int expected = static_cast<int>(p);
        for (const auto& id : received[p].ids) {
            EXPECT_EQ(std::stoi(id), expected);
            expected += 3;
        }
    }
}

TEST_F(ScannerTest, FullBatchesThenOneShortBatchPerPartition) {
    uint64_t scanned = 0;
    auto received = Run(95, 2, 10, 0, &scanned);
    // 48 records in partition 0, 47 in partition 1
    EXPECT_EQ(received[0].batch_sizes, (std::vector<size_t>{10, 10, 10, 10, 8}));
    EXPECT_EQ(received[1].batch_sizes, (std::vector<size_t>{10, 10, 10, 10, 7}));
    EXPECT_EQ(batches_sent_, 10u);
}

TEST_F(ScannerTest, RespectsLimit) {
    uint64_t scanned = 0;
    auto received = Run(500, 2, 10, 123, &scanned);
    EXPECT_EQ(scanned, 123u);
    EXPECT_EQ(received[0].ids.size() + received[1].ids.size(), 123u);
}

TEST_F(ScannerTest, EmptyInputClosesChannels) {
    uint64_t scanned = 0;
    auto received = Run(0, 3, 10, 0, &scanned);
    EXPECT_EQ(scanned, 0u);
    EXPECT_EQ(batches_sent_, 0u);
    for (const auto& partition : received) {
        EXPECT_TRUE(partition.ids.empty());
    }
}
