#ifndef APPTRACE_STORAGE_POSTGRES_POSTGRES_STORAGE_H_
#define APPTRACE_STORAGE_POSTGRES_POSTGRES_STORAGE_H_

#include <memory>

#include "apptrace/storage/storage.h"
#include "apptrace/storage/batch_writer.h"
#include "apptrace/storage/postgres/connection.h"

namespace apptrace {
namespace storage {
namespace pg {

/**
 * @brief Log store over PostgreSQL
 *
 * Writes go through the injected BatchWriter (insert, or copy with insert
 * fallback); reads open one connection per call.
 */
class PostgresLogStore : public LogStore {
public:
    PostgresLogStore(std::shared_ptr<ConnectionFactory> factory,
                     std::shared_ptr<BatchWriter<core::LogRecord>> writer);

    core::Result<void> insert_batch(const std::vector<core::LogRecord>& records) override;
    core::Result<std::vector<core::LogRecord>> get_page(size_t limit, size_t offset) override;
    core::Result<std::vector<core::LogRecord>> search(
        const std::string& term, size_t limit, size_t offset) override;

private:
    std::shared_ptr<ConnectionFactory> factory_;
    std::shared_ptr<BatchWriter<core::LogRecord>> writer_;
};

class PostgresSpanStore : public SpanStore {
public:
    PostgresSpanStore(std::shared_ptr<ConnectionFactory> factory,
                      std::shared_ptr<BatchWriter<core::SpanRecord>> writer);

    core::Result<void> insert_batch(const std::vector<core::SpanRecord>& records) override;
    core::Result<std::vector<core::SpanRecord>> get_page(size_t limit, size_t offset) override;
    core::Result<std::vector<core::SpanRecord>> get_by_trace_id(const std::string& trace_id) override;

private:
    std::shared_ptr<ConnectionFactory> factory_;
    std::shared_ptr<BatchWriter<core::SpanRecord>> writer_;
};

class PostgresMetricStore : public MetricStore {
public:
    PostgresMetricStore(std::shared_ptr<ConnectionFactory> factory,
                        std::shared_ptr<BatchWriter<core::MetricRecord>> writer);

    core::Result<void> insert_batch(const std::vector<core::MetricRecord>& records) override;
    core::Result<std::vector<core::MetricRecord>> get_page(size_t limit, size_t offset) override;
    core::Result<std::vector<core::MetricRecord>> search(
        const std::string& term, size_t limit, size_t offset) override;

private:
    std::shared_ptr<ConnectionFactory> factory_;
    std::shared_ptr<BatchWriter<core::MetricRecord>> writer_;
};

} // namespace pg
} // namespace storage
} // namespace apptrace

#endif // APPTRACE_STORAGE_POSTGRES_POSTGRES_STORAGE_H_
