#include "apptrace/storage/postgres/record_tables.h"
#include "apptrace/storage/attribute_json.h"

#include <cstdlib>
#include <sstream>

namespace apptrace {
namespace storage {
namespace pg {

namespace {

int64_t ParseInt64(const std::string& text) {
    return static_cast<int64_t>(std::strtoll(text.c_str(), nullptr, 10));
}

double ParseDouble(const std::string& text) {
    return std::strtod(text.c_str(), nullptr);
}

std::string Placeholder(ColumnKind kind, size_t index) {
    auto param = "$" + std::to_string(index);
    switch (kind) {
        case ColumnKind::UUID:
            return param + "::uuid";
        case ColumnKind::TIMESTAMP:
            return "TIMESTAMPTZ 'epoch' + " + param + "::bigint * INTERVAL '1 microsecond'";
        case ColumnKind::FLOAT8:
            return param + "::float8";
        case ColumnKind::JSONB:
            return param + "::jsonb";
        case ColumnKind::TEXT:
        case ColumnKind::OPTIONAL_TEXT:
            break;
    }
    return param;
}

std::string ColumnList(const std::vector<Column>& columns) {
    std::string list;
    for (size_t i = 0; i < columns.size(); i++) {
        if (i > 0) {
            list += ", ";
        }
        list += columns[i].name;
    }
    return list;
}

} // namespace

// logs

const char* const RecordTable<core::LogRecord>::kSelect =
    "id::text, (EXTRACT(EPOCH FROM \"timestamp\") * 1000000)::bigint, trace_id, span_id, "
    "severity, body, attributes::text";

const std::vector<Column>& RecordTable<core::LogRecord>::Columns() {
    static const std::vector<Column> columns = {
        {"id", ColumnKind::UUID},
        {"\"timestamp\"", ColumnKind::TIMESTAMP},
        {"trace_id", ColumnKind::OPTIONAL_TEXT},
        {"span_id", ColumnKind::OPTIONAL_TEXT},
        {"severity", ColumnKind::TEXT},
        {"body", ColumnKind::TEXT},
        {"attributes", ColumnKind::JSONB},
        {"service_name", ColumnKind::TEXT},
    };
    return columns;
}

void RecordTable<core::LogRecord>::Encode(const core::LogRecord& record, FieldSink& sink) {
    sink.add_uuid(record.id);
    sink.add_timestamp(record.timestamp);
    sink.add_optional_text(record.trace_id);
    sink.add_optional_text(record.span_id);
    sink.add_text(record.severity);
    sink.add_text(record.body);
    sink.add_jsonb(SerializeAttributes(record.attributes));
    sink.add_text(core::ServiceNameOf(record.attributes));
}

core::LogRecord RecordTable<core::LogRecord>::FromRow(const QueryResult& result, int row) {
    core::LogRecord record;
    record.id = result.get(row, 0);
    record.timestamp = ParseInt64(result.get(row, 1));
    record.trace_id = result.get(row, 2);
    record.span_id = result.get(row, 3);
    record.severity = result.get(row, 4);
    record.body = result.get(row, 5);
    record.attributes = ParseAttributes(result.get(row, 6));
    return record;
}

// traces

// duration_ms is a generated column and never written.
const char* const RecordTable<core::SpanRecord>::kSelect =
    "id::text, trace_id, span_id, parent_span_id, name, "
    "(EXTRACT(EPOCH FROM start_time) * 1000000)::bigint, "
    "(EXTRACT(EPOCH FROM end_time) * 1000000)::bigint, "
    "attributes::text, status";

const std::vector<Column>& RecordTable<core::SpanRecord>::Columns() {
    static const std::vector<Column> columns = {
        {"id", ColumnKind::UUID},
        {"trace_id", ColumnKind::TEXT},
        {"span_id", ColumnKind::TEXT},
        {"parent_span_id", ColumnKind::OPTIONAL_TEXT},
        {"name", ColumnKind::TEXT},
        {"start_time", ColumnKind::TIMESTAMP},
        {"end_time", ColumnKind::TIMESTAMP},
        {"attributes", ColumnKind::JSONB},
        {"status", ColumnKind::TEXT},
        {"service_name", ColumnKind::TEXT},
    };
    return columns;
}

void RecordTable<core::SpanRecord>::Encode(const core::SpanRecord& record, FieldSink& sink) {
    sink.add_uuid(record.id);
    sink.add_text(record.trace_id);
    sink.add_text(record.span_id);
    sink.add_optional_text(record.parent_span_id);
    sink.add_text(record.name);
    sink.add_timestamp(record.start_time);
    sink.add_timestamp(record.end_time);
    sink.add_jsonb(SerializeAttributes(record.attributes));
    sink.add_text(record.status);
    sink.add_text(core::ServiceNameOf(record.attributes));
}

core::SpanRecord RecordTable<core::SpanRecord>::FromRow(const QueryResult& result, int row) {
    core::SpanRecord record;
    record.id = result.get(row, 0);
    record.trace_id = result.get(row, 1);
    record.span_id = result.get(row, 2);
    record.parent_span_id = result.get(row, 3);
    record.name = result.get(row, 4);
    record.start_time = ParseInt64(result.get(row, 5));
    record.end_time = ParseInt64(result.get(row, 6));
    record.attributes = ParseAttributes(result.get(row, 7));
    record.status = result.get(row, 8);
    return record;
}

// metrics

const char* const RecordTable<core::MetricRecord>::kSelect =
    "id::text, name, (EXTRACT(EPOCH FROM \"timestamp\") * 1000000)::bigint, value, "
    "attributes::text";

const std::vector<Column>& RecordTable<core::MetricRecord>::Columns() {
    static const std::vector<Column> columns = {
        {"id", ColumnKind::UUID},
        {"name", ColumnKind::TEXT},
        {"\"timestamp\"", ColumnKind::TIMESTAMP},
        {"value", ColumnKind::FLOAT8},
        {"attributes", ColumnKind::JSONB},
        {"service_name", ColumnKind::TEXT},
    };
    return columns;
}

void RecordTable<core::MetricRecord>::Encode(const core::MetricRecord& record, FieldSink& sink) {
    sink.add_uuid(record.id);
    sink.add_text(record.name);
    sink.add_timestamp(record.timestamp);
    sink.add_float8(record.value);
    sink.add_jsonb(SerializeAttributes(record.attributes));
    sink.add_text(core::ServiceNameOf(record.attributes));
}

core::MetricRecord RecordTable<core::MetricRecord>::FromRow(const QueryResult& result, int row) {
    core::MetricRecord record;
    record.id = result.get(row, 0);
    record.name = result.get(row, 1);
    record.timestamp = ParseInt64(result.get(row, 2));
    record.value = ParseDouble(result.get(row, 3));
    record.attributes = ParseAttributes(result.get(row, 4));
    return record;
}

std::string BuildInsertSql(const std::string& table, const std::vector<Column>& columns,
                           size_t row_count) {
    std::ostringstream sql;
    sql << "INSERT INTO " << table << " (" << ColumnList(columns) << ") VALUES ";
    size_t index = 1;
    for (size_t row = 0; row < row_count; row++) {
        sql << (row > 0 ? ", (" : "(");
        for (size_t col = 0; col < columns.size(); col++) {
            if (col > 0) {
                sql << ", ";
            }
            sql << Placeholder(columns[col].kind, index++);
        }
        sql << ")";
    }
    return sql.str();
}

std::string BuildCopySql(const std::string& table, const std::vector<Column>& columns) {
    return "COPY " + table + " (" + ColumnList(columns) + ") FROM STDIN (FORMAT BINARY)";
}

std::string ContainsPattern(const std::string& term) {
    std::string pattern = "%";
    for (char c : term) {
        if (c == '%' || c == '_' || c == '\\') {
            pattern.push_back('\\');
        }
        pattern.push_back(c);
    }
    pattern.push_back('%');
    return pattern;
}

} // namespace pg
} // namespace storage
} // namespace apptrace
