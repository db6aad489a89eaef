#pragma once

#include <memory>
#include <string>
#include <vector>

#include <gmock/gmock.h>

#include "apptrace/storage/batch_writer.h"
#include "apptrace/storage/postgres/connection.h"
#include "apptrace/storage/storage.h"

namespace apptrace {
namespace testutil {

template<typename Record>
class MockBatchWriter : public storage::BatchWriter<Record> {
public:
    MOCK_METHOD(core::Result<void>, write, (const std::vector<Record>&), (override));
    MOCK_METHOD(std::string, name, (), (const, override));
};

class MockLogStore : public storage::LogStore {
public:
    MOCK_METHOD(core::Result<void>, insert_batch, (const std::vector<core::LogRecord>&), (override));
    MOCK_METHOD(core::Result<std::vector<core::LogRecord>>, get_page, (size_t, size_t), (override));
    MOCK_METHOD(core::Result<std::vector<core::LogRecord>>, search,
                (const std::string&, size_t, size_t), (override));
};

class MockSpanStore : public storage::SpanStore {
public:
    MOCK_METHOD(core::Result<void>, insert_batch, (const std::vector<core::SpanRecord>&), (override));
    MOCK_METHOD(core::Result<std::vector<core::SpanRecord>>, get_page, (size_t, size_t), (override));
    MOCK_METHOD(core::Result<std::vector<core::SpanRecord>>, get_by_trace_id,
                (const std::string&), (override));
};

class MockMetricStore : public storage::MetricStore {
public:
    MOCK_METHOD(core::Result<void>, insert_batch, (const std::vector<core::MetricRecord>&), (override));
    MOCK_METHOD(core::Result<std::vector<core::MetricRecord>>, get_page, (size_t, size_t), (override));
    MOCK_METHOD(core::Result<std::vector<core::MetricRecord>>, search,
                (const std::string&, size_t, size_t), (override));
};

class MockConnectionFactory : public storage::pg::ConnectionFactory {
public:
    MOCK_METHOD(std::unique_ptr<storage::pg::Connection>, open, (), (override));
};

} // namespace testutil
} // namespace apptrace
