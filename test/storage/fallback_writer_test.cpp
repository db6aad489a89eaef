#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "apptrace/storage/batch_writer.h"
#include "test_util/mock_storage.h"
#include "test_util/otlp_builders.h"

namespace apptrace {
namespace storage {
namespace {

using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using testutil::MockBatchWriter;

class FallbackWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        primary_ = std::make_shared<NiceMock<MockBatchWriter<core::LogRecord>>>();
        secondary_ = std::make_shared<NiceMock<MockBatchWriter<core::LogRecord>>>();
        ON_CALL(*primary_, name()).WillByDefault(Return("copy"));
        ON_CALL(*secondary_, name()).WillByDefault(Return("insert"));
        writer_ = std::make_unique<FallbackWriter<core::LogRecord>>(primary_, secondary_);
        batch_ = {testutil::MakeLog(1, "a"), testutil::MakeLog(2, "b")};
    }

    std::shared_ptr<NiceMock<MockBatchWriter<core::LogRecord>>> primary_;
    std::shared_ptr<NiceMock<MockBatchWriter<core::LogRecord>>> secondary_;
    std::unique_ptr<FallbackWriter<core::LogRecord>> writer_;
    std::vector<core::LogRecord> batch_;
};

TEST_F(FallbackWriterTest, PrimarySuccessSkipsSecondary) {
    EXPECT_CALL(*primary_, write(_))
        .WillOnce(Invoke([this](const std::vector<core::LogRecord>& records) {
            EXPECT_EQ(records, batch_);
            return core::Result<void>();
        }));
    EXPECT_CALL(*secondary_, write(_)).Times(0);

    auto result = writer_->write(batch_);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(writer_->primary_batches(), 1u);
    EXPECT_EQ(writer_->fallback_batches(), 0u);
}

TEST_F(FallbackWriterTest, PrimaryFailureIsRetriedOnSecondary) {
    EXPECT_CALL(*primary_, write(_))
        .WillOnce(Invoke([](const std::vector<core::LogRecord>&) {
            return core::Result<void>::error("COPY failed: connection reset");
        }));
    EXPECT_CALL(*secondary_, write(_))
        .WillOnce(Invoke([this](const std::vector<core::LogRecord>& records) {
            EXPECT_EQ(records, batch_);
            return core::Result<void>();
        }));

    auto result = writer_->write(batch_);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(writer_->primary_batches(), 0u);
    EXPECT_EQ(writer_->fallback_batches(), 1u);
    EXPECT_EQ(writer_->failed_batches(), 0u);
}

TEST_F(FallbackWriterTest, DoubleFailureCarriesBothCauses) {
    EXPECT_CALL(*primary_, write(_))
        .WillOnce(Invoke([](const std::vector<core::LogRecord>&) {
            return core::Result<void>::error("COPY failed: bad row");
        }));
    EXPECT_CALL(*secondary_, write(_))
        .WillOnce(Invoke([](const std::vector<core::LogRecord>&) {
            return core::Result<void>::error("Statement failed: relation \"logs\" does not exist");
        }));

    auto result = writer_->write(batch_);
    ASSERT_FALSE(result.ok());
    EXPECT_NE(result.error().find("relation \"logs\" does not exist"), std::string::npos);
    EXPECT_NE(result.error().find("COPY failed: bad row"), std::string::npos);
    EXPECT_EQ(writer_->failed_batches(), 1u);
}

TEST_F(FallbackWriterTest, NameCombinesStages) {
    EXPECT_EQ(writer_->name(), "copy+insert");
}

} // namespace
} // namespace storage
} // namespace apptrace
