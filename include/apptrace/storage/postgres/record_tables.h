#ifndef APPTRACE_STORAGE_POSTGRES_RECORD_TABLES_H_
#define APPTRACE_STORAGE_POSTGRES_RECORD_TABLES_H_

#include <string>
#include <vector>

#include "apptrace/core/types.h"
#include "apptrace/storage/postgres/connection.h"
#include "apptrace/storage/postgres/encoding.h"

namespace apptrace {
namespace storage {
namespace pg {

/**
 * @brief PostgreSQL caps one statement at this many bind parameters
 */
constexpr size_t kMaxStatementParams = 65535;

/**
 * @brief Table mapping of one record kind
 *
 * Each specialization provides:
 *   kTable     table name
 *   Columns()  insert columns, in encode order
 *   Encode()   write one record into a FieldSink
 *   kSelect    select list whose column order matches FromRow()
 *   kTimeColumn the column pages are ordered by
 */
template<typename Record>
struct RecordTable;

template<>
struct RecordTable<core::LogRecord> {
    static constexpr const char* kTable = "logs";
    static constexpr const char* kTimeColumn = "\"timestamp\"";
    static const char* const kSelect;

    static const std::vector<Column>& Columns();
    static void Encode(const core::LogRecord& record, FieldSink& sink);
    static core::LogRecord FromRow(const QueryResult& result, int row);
};

template<>
struct RecordTable<core::SpanRecord> {
    static constexpr const char* kTable = "traces";
    static constexpr const char* kTimeColumn = "start_time";
    static const char* const kSelect;

    static const std::vector<Column>& Columns();
    static void Encode(const core::SpanRecord& record, FieldSink& sink);
    static core::SpanRecord FromRow(const QueryResult& result, int row);
};

template<>
struct RecordTable<core::MetricRecord> {
    static constexpr const char* kTable = "metrics";
    static constexpr const char* kTimeColumn = "\"timestamp\"";
    static const char* const kSelect;

    static const std::vector<Column>& Columns();
    static void Encode(const core::MetricRecord& record, FieldSink& sink);
    static core::MetricRecord FromRow(const QueryResult& result, int row);
};

/**
 * @brief INSERT ... VALUES with @p row_count parameter tuples
 *
 * Parameters are numbered row-major from $1 and cast to the column type.
 */
std::string BuildInsertSql(const std::string& table, const std::vector<Column>& columns,
                           size_t row_count);

/**
 * @brief COPY table (columns) FROM STDIN (FORMAT BINARY)
 */
std::string BuildCopySql(const std::string& table, const std::vector<Column>& columns);

/**
 * @brief ILIKE pattern matching @p term literally anywhere, escaped with backslash
 */
std::string ContainsPattern(const std::string& term);

} // namespace pg
} // namespace storage
} // namespace apptrace

#endif // APPTRACE_STORAGE_POSTGRES_RECORD_TABLES_H_
