#include <gtest/gtest.h>
#include <limits>
#include <set>
#include <thread>
#include <vector>
#include "apptrace/storage/memory_storage.h"
#include "test_util/otlp_builders.h"

namespace apptrace {
namespace storage {
namespace {

using testutil::MakeLog;
using testutil::MakeMetric;
using testutil::MakeSpan;

class MemoryLogStoreTest : public ::testing::Test {
protected:
    MemoryLogStore store_;
};

TEST_F(MemoryLogStoreTest, EmptyBatchIsNoOp) {
    auto result = store_.insert_batch({});
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(store_.size(), 0u);

    auto page = store_.get_page(10, 0);
    ASSERT_TRUE(page.ok());
    EXPECT_TRUE(page.value().empty());
}

TEST_F(MemoryLogStoreTest, RoundTripKeepsAllFields) {
    std::vector<core::LogRecord> batch;
    for (int i = 0; i < 5; i++) {
        auto log = MakeLog(1000 + i, "message " + std::to_string(i));
        log.trace_id = "0af7651916cd43dd8448eb211c80319c";
        log.attributes["attempt"] = int64_t{i};
        log.attributes["ratio"] = 0.5 * i;
        log.attributes["cached"] = (i % 2 == 0);
        log.attributes["payload"] = core::Bytes{0x01, static_cast<uint8_t>(i)};
        batch.push_back(log);
    }
    ASSERT_TRUE(store_.insert_batch(batch).ok());

    auto page = store_.get_page(10, 0);
    ASSERT_TRUE(page.ok());
    ASSERT_EQ(page.value().size(), 5u);
    // Newest first
    for (size_t i = 0; i < 5; i++) {
        EXPECT_EQ(page.value()[i], batch[4 - i]);
    }
}

TEST_F(MemoryLogStoreTest, PagesAreDisjointAndSortedDescending) {
    std::vector<core::LogRecord> batch;
    // Interleaved timestamps so insertion order differs from time order
    for (int i = 0; i < 25; i++) {
        batch.push_back(MakeLog((i * 7) % 25, "log"));
    }
    ASSERT_TRUE(store_.insert_batch(batch).ok());

    std::set<std::string> seen;
    core::Timestamp previous = std::numeric_limits<core::Timestamp>::max();
    for (size_t offset = 0; offset < 30; offset += 10) {
        auto page = store_.get_page(10, offset);
        ASSERT_TRUE(page.ok());
        for (const auto& log : page.value()) {
            EXPECT_TRUE(seen.insert(log.id).second) << "duplicate " << log.id;
            EXPECT_LE(log.timestamp, previous);
            previous = log.timestamp;
        }
    }
    EXPECT_EQ(seen.size(), 25u);
}

TEST_F(MemoryLogStoreTest, ZeroLimitAndOffsetPastEndReturnEmpty) {
    ASSERT_TRUE(store_.insert_batch({MakeLog(1, "a"), MakeLog(2, "b")}).ok());

    auto zero = store_.get_page(0, 0);
    ASSERT_TRUE(zero.ok());
    EXPECT_TRUE(zero.value().empty());

    auto past_end = store_.get_page(10, 5);
    ASSERT_TRUE(past_end.ok());
    EXPECT_TRUE(past_end.value().empty());

    auto partial = store_.get_page(10, 1);
    ASSERT_TRUE(partial.ok());
    ASSERT_EQ(partial.value().size(), 1u);
    EXPECT_EQ(partial.value()[0].body, "a");
}

TEST_F(MemoryLogStoreTest, EqualTimestampsKeepInsertionOrder) {
    ASSERT_TRUE(store_.insert_batch({MakeLog(5, "first"), MakeLog(5, "second"), MakeLog(5, "third")}).ok());
    auto page = store_.get_page(10, 0);
    ASSERT_TRUE(page.ok());
    ASSERT_EQ(page.value().size(), 3u);
    EXPECT_EQ(page.value()[0].body, "first");
    EXPECT_EQ(page.value()[1].body, "second");
    EXPECT_EQ(page.value()[2].body, "third");
}

TEST_F(MemoryLogStoreTest, SearchMatchesBodyOrAttributesCaseInsensitively) {
    std::vector<core::LogRecord> batch;
    for (int i = 0; i < 8; i++) {
        batch.push_back(MakeLog(i, "routine message " + std::to_string(i)));
    }
    batch[1].body = "Payment FAILED for order 17";
    batch[4].body = "retrying after payment failure";
    batch[6].attributes["error.type"] = std::string("PaymentGatewayTimeout");
    ASSERT_TRUE(store_.insert_batch(batch).ok());

    auto result = store_.search("payment", 10, 0);
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value().size(), 3u);
    EXPECT_EQ(result.value()[0].id, batch[6].id);
    EXPECT_EQ(result.value()[1].id, batch[4].id);
    EXPECT_EQ(result.value()[2].id, batch[1].id);

    auto paged = store_.search("payment", 1, 1);
    ASSERT_TRUE(paged.ok());
    ASSERT_EQ(paged.value().size(), 1u);
    EXPECT_EQ(paged.value()[0].id, batch[4].id);

    auto none = store_.search("inventory", 10, 0);
    ASSERT_TRUE(none.ok());
    EXPECT_TRUE(none.value().empty());
}

TEST_F(MemoryLogStoreTest, SearchTreatsWildcardsLiterally) {
    ASSERT_TRUE(store_.insert_batch({MakeLog(1, "100% done"), MakeLog(2, "1000 done")}).ok());
    auto result = store_.search("0%", 10, 0);
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].body, "100% done");
}

TEST_F(MemoryLogStoreTest, ConcurrentInsertsLoseNothing) {
    constexpr int kThreads = 10;
    constexpr int kPerThread = 10;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; t++) {
        threads.emplace_back([this, t]() {
            std::vector<core::LogRecord> batch;
            for (int i = 0; i < kPerThread; i++) {
                batch.push_back(MakeLog(t * kPerThread + i, "thread " + std::to_string(t)));
            }
            EXPECT_TRUE(store_.insert_batch(batch).ok());
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto page = store_.get_page(1000, 0);
    ASSERT_TRUE(page.ok());
    EXPECT_EQ(page.value().size(), static_cast<size_t>(kThreads * kPerThread));

    std::set<std::string> ids;
    for (const auto& log : page.value()) {
        ids.insert(log.id);
    }
    EXPECT_EQ(ids.size(), static_cast<size_t>(kThreads * kPerThread));
}

TEST(MemorySpanStoreTest, PageByStartTimeAndTraceLookup) {
    MemorySpanStore store;
    const std::string trace_a = "4bf92f3577b34da6a3ce929d0e0e4736";
    const std::string trace_b = "00f067aa0ba902b700f067aa0ba902b7";

    ASSERT_TRUE(store.insert_batch({
        MakeSpan(trace_a, 300, 400, "a-late"),
        MakeSpan(trace_b, 200, 250, "b-only"),
        MakeSpan(trace_a, 100, 500, "a-root"),
    }).ok());

    auto page = store.get_page(10, 0);
    ASSERT_TRUE(page.ok());
    ASSERT_EQ(page.value().size(), 3u);
    EXPECT_EQ(page.value()[0].name, "a-late");
    EXPECT_EQ(page.value()[1].name, "b-only");
    EXPECT_EQ(page.value()[2].name, "a-root");

    auto trace = store.get_by_trace_id(trace_a);
    ASSERT_TRUE(trace.ok());
    ASSERT_EQ(trace.value().size(), 2u);
    EXPECT_EQ(trace.value()[0].name, "a-root");
    EXPECT_EQ(trace.value()[1].name, "a-late");
    EXPECT_EQ(trace.value()[0].duration(), 400);

    auto missing = store.get_by_trace_id("ffffffffffffffffffffffffffffffff");
    ASSERT_TRUE(missing.ok());
    EXPECT_TRUE(missing.value().empty());
}

TEST(MemorySpanStoreTest, EmptyBatchIsNoOp) {
    MemorySpanStore store;
    EXPECT_TRUE(store.insert_batch({}).ok());
    EXPECT_EQ(store.size(), 0u);
}

TEST(MemoryMetricStoreTest, RoundTripAndSearchByName) {
    MemoryMetricStore store;
    std::vector<core::MetricRecord> batch = {
        MakeMetric(10, "http.server.duration", 12.5),
        MakeMetric(20, "process.cpu.time", 0.75),
        MakeMetric(30, "http.client.duration", 3.0),
    };
    batch[1].attributes["host.name"] = std::string("HTTP-gateway-1");
    ASSERT_TRUE(store.insert_batch(batch).ok());

    auto page = store.get_page(2, 0);
    ASSERT_TRUE(page.ok());
    ASSERT_EQ(page.value().size(), 2u);
    EXPECT_EQ(page.value()[0], batch[2]);
    EXPECT_EQ(page.value()[1], batch[1]);

    auto found = store.search("http", 10, 0);
    ASSERT_TRUE(found.ok());
    EXPECT_EQ(found.value().size(), 3u);

    auto duration = store.search("DURATION", 10, 0);
    ASSERT_TRUE(duration.ok());
    ASSERT_EQ(duration.value().size(), 2u);
    EXPECT_EQ(duration.value()[0].name, "http.client.duration");
}

TEST(MemoryMetricStoreTest, ZeroLimitSearchIsEmpty) {
    MemoryMetricStore store;
    ASSERT_TRUE(store.insert_batch({MakeMetric(1, "m", 1.0)}).ok());
    auto result = store.search("m", 0, 0);
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.value().empty());
}

} // namespace
} // namespace storage
} // namespace apptrace
