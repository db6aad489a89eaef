#include "apptrace/storage/postgres/postgres_storage.h"
#include "apptrace/storage/postgres/record_tables.h"

#include <exception>

namespace apptrace {
namespace storage {
namespace pg {

namespace {

template<typename Record>
core::Result<std::vector<Record>> SelectRecords(ConnectionFactory& factory,
                                                const std::string& sql,
                                                const std::vector<Param>& params) {
    try {
        auto conn = factory.open();
        auto result = conn->exec_params(sql, params);
        std::vector<Record> records;
        records.reserve(static_cast<size_t>(result.rows()));
        for (int row = 0; row < result.rows(); row++) {
            records.push_back(RecordTable<Record>::FromRow(result, row));
        }
        return records;
    } catch (const std::exception& e) {
        return core::Result<std::vector<Record>>::error(e.what());
    }
}

template<typename Record>
std::string SelectPrefix() {
    using Table = RecordTable<Record>;
    return std::string("SELECT ") + Table::kSelect + " FROM " + Table::kTable;
}

template<typename Record>
std::string NewestFirst() {
    return std::string(" ORDER BY ") + RecordTable<Record>::kTimeColumn + " DESC";
}

template<typename Record>
core::Result<std::vector<Record>> Page(ConnectionFactory& factory, size_t limit, size_t offset) {
    if (limit == 0) {
        return std::vector<Record>();
    }
    auto sql = SelectPrefix<Record>() + NewestFirst<Record>() +
               " LIMIT $1::bigint OFFSET $2::bigint";
    return SelectRecords<Record>(factory, sql, {std::to_string(limit), std::to_string(offset)});
}

template<typename Record>
core::Result<std::vector<Record>> Search(ConnectionFactory& factory, const char* text_column,
                                         const std::string& term, size_t limit, size_t offset) {
    if (limit == 0) {
        return std::vector<Record>();
    }
    auto sql = SelectPrefix<Record>() + " WHERE " + text_column + " ILIKE $1 ESCAPE '\\'" +
               " OR attributes::text ILIKE $1 ESCAPE '\\'" + NewestFirst<Record>() +
               " LIMIT $2::bigint OFFSET $3::bigint";
    return SelectRecords<Record>(factory, sql,
                                 {ContainsPattern(term), std::to_string(limit), std::to_string(offset)});
}

} // namespace

// PostgresLogStore

PostgresLogStore::PostgresLogStore(std::shared_ptr<ConnectionFactory> factory,
                                   std::shared_ptr<BatchWriter<core::LogRecord>> writer)
    : factory_(std::move(factory)), writer_(std::move(writer)) {}

core::Result<void> PostgresLogStore::insert_batch(const std::vector<core::LogRecord>& records) {
    if (records.empty()) {
        return core::Result<void>();
    }
    return writer_->write(records);
}

core::Result<std::vector<core::LogRecord>> PostgresLogStore::get_page(size_t limit, size_t offset) {
    return Page<core::LogRecord>(*factory_, limit, offset);
}

core::Result<std::vector<core::LogRecord>> PostgresLogStore::search(
    const std::string& term, size_t limit, size_t offset) {
    return Search<core::LogRecord>(*factory_, "body", term, limit, offset);
}

// PostgresSpanStore

PostgresSpanStore::PostgresSpanStore(std::shared_ptr<ConnectionFactory> factory,
                                     std::shared_ptr<BatchWriter<core::SpanRecord>> writer)
    : factory_(std::move(factory)), writer_(std::move(writer)) {}

core::Result<void> PostgresSpanStore::insert_batch(const std::vector<core::SpanRecord>& records) {
    if (records.empty()) {
        return core::Result<void>();
    }
    return writer_->write(records);
}

core::Result<std::vector<core::SpanRecord>> PostgresSpanStore::get_page(size_t limit, size_t offset) {
    return Page<core::SpanRecord>(*factory_, limit, offset);
}

core::Result<std::vector<core::SpanRecord>> PostgresSpanStore::get_by_trace_id(
    const std::string& trace_id) {
    auto sql = SelectPrefix<core::SpanRecord>() + " WHERE trace_id = $1 ORDER BY start_time ASC";
    return SelectRecords<core::SpanRecord>(*factory_, sql, {trace_id});
}

// PostgresMetricStore

PostgresMetricStore::PostgresMetricStore(std::shared_ptr<ConnectionFactory> factory,
                                         std::shared_ptr<BatchWriter<core::MetricRecord>> writer)
    : factory_(std::move(factory)), writer_(std::move(writer)) {}

core::Result<void> PostgresMetricStore::insert_batch(const std::vector<core::MetricRecord>& records) {
    if (records.empty()) {
        return core::Result<void>();
    }
    return writer_->write(records);
}

core::Result<std::vector<core::MetricRecord>> PostgresMetricStore::get_page(size_t limit, size_t offset) {
    return Page<core::MetricRecord>(*factory_, limit, offset);
}

core::Result<std::vector<core::MetricRecord>> PostgresMetricStore::search(
    const std::string& term, size_t limit, size_t offset) {
    return Search<core::MetricRecord>(*factory_, "name", term, limit, offset);
}

} // namespace pg
} // namespace storage
} // namespace apptrace
