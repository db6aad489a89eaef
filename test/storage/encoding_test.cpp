#include <gtest/gtest.h>
#include <cstring>
#include <limits>
#include "apptrace/core/error.h"
#include "apptrace/storage/postgres/encoding.h"
#include "apptrace/storage/postgres/record_tables.h"
#include "test_util/otlp_builders.h"

namespace apptrace {
namespace storage {
namespace pg {
namespace {

const std::string kSignature("PGCOPY\n\377\r\n\0", 11);

uint32_t ReadUint32(const std::string& data, size_t offset) {
    return (static_cast<uint32_t>(static_cast<uint8_t>(data[offset])) << 24) |
           (static_cast<uint32_t>(static_cast<uint8_t>(data[offset + 1])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(data[offset + 2])) << 8) |
           static_cast<uint32_t>(static_cast<uint8_t>(data[offset + 3]));
}

uint16_t ReadUint16(const std::string& data, size_t offset) {
    return static_cast<uint16_t>((static_cast<uint8_t>(data[offset]) << 8) |
                                 static_cast<uint8_t>(data[offset + 1]));
}

uint64_t ReadUint64(const std::string& data, size_t offset) {
    return (static_cast<uint64_t>(ReadUint32(data, offset)) << 32) | ReadUint32(data, offset + 4);
}

TEST(CopyEncoderTest, EmptyPayloadIsHeaderAndTrailer) {
    CopyEncoder encoder;
    auto payload = encoder.finish();
    ASSERT_EQ(payload.size(), 11u + 4u + 4u + 2u);
    EXPECT_EQ(payload.substr(0, 11), kSignature);
    EXPECT_EQ(ReadUint32(payload, 11), 0u);
    EXPECT_EQ(ReadUint32(payload, 15), 0u);
    EXPECT_EQ(ReadUint16(payload, 19), 0xFFFF);
}

TEST(CopyEncoderTest, FieldEncodings) {
    CopyEncoder encoder;
    encoder.begin_row(6);
    encoder.add_uuid("01234567-89ab-cdef-0123-456789abcdef");
    encoder.add_timestamp(kPostgresEpochOffsetMicros + 5);
    encoder.add_text("hi");
    encoder.add_optional_text("");
    encoder.add_float8(1.0);
    encoder.add_jsonb("{}");
    auto payload = encoder.finish();
    EXPECT_EQ(encoder.row_count(), 1u);

    size_t pos = 19;
    EXPECT_EQ(ReadUint16(payload, pos), 6);
    pos += 2;

    // uuid: 16 raw bytes
    ASSERT_EQ(ReadUint32(payload, pos), 16u);
    pos += 4;
    EXPECT_EQ(static_cast<uint8_t>(payload[pos]), 0x01);
    EXPECT_EQ(static_cast<uint8_t>(payload[pos + 15]), 0xef);
    pos += 16;

    // timestamptz: microseconds since 2000-01-01
    ASSERT_EQ(ReadUint32(payload, pos), 8u);
    EXPECT_EQ(ReadUint64(payload, pos + 4), 5u);
    pos += 12;

    // text
    ASSERT_EQ(ReadUint32(payload, pos), 2u);
    EXPECT_EQ(payload.substr(pos + 4, 2), "hi");
    pos += 6;

    // empty optional text is NULL
    EXPECT_EQ(ReadUint32(payload, pos), 0xFFFFFFFFu);
    pos += 4;

    // float8: IEEE-754 big endian
    ASSERT_EQ(ReadUint32(payload, pos), 8u);
    EXPECT_EQ(ReadUint64(payload, pos + 4), 0x3FF0000000000000ULL);
    pos += 12;

    // jsonb: version byte then text
    ASSERT_EQ(ReadUint32(payload, pos), 3u);
    EXPECT_EQ(payload[pos + 4], '\x01');
    EXPECT_EQ(payload.substr(pos + 5, 2), "{}");
    pos += 7;

    EXPECT_EQ(ReadUint16(payload, pos), 0xFFFF);
    EXPECT_EQ(pos + 2, payload.size());
}

TEST(CopyEncoderTest, PreEpochTimestampIsNegative) {
    CopyEncoder encoder;
    encoder.begin_row(1);
    encoder.add_timestamp(0);  // 1970-01-01
    auto payload = encoder.finish();
    auto raw = static_cast<int64_t>(ReadUint64(payload, 21 + 4));
    EXPECT_EQ(raw, -kPostgresEpochOffsetMicros);
}

TEST(ParseUuidTest, RejectsMalformed) {
    EXPECT_THROW(ParseUuid(""), core::InvalidArgumentError);
    EXPECT_THROW(ParseUuid("0123456789abcdef0123456789abcdef"), core::InvalidArgumentError);
    EXPECT_THROW(ParseUuid("0123456z-89ab-cdef-0123-456789abcdef"), core::InvalidArgumentError);
    auto bytes = ParseUuid("FFFFFFFF-0000-4000-8000-000000000001");
    EXPECT_EQ(bytes[0], 0xFF);
    EXPECT_EQ(bytes[15], 0x01);
}

TEST(ParamEncoderTest, TextParameters) {
    ParamEncoder params;
    params.add_uuid("0123-uuid");
    params.add_timestamp(1700000000123456);
    params.add_optional_text("");
    params.add_optional_text("abc");
    params.add_float8(0.1);
    params.add_jsonb("{\"a\":1}");

    const auto& values = params.params();
    ASSERT_EQ(values.size(), 6u);
    EXPECT_EQ(*values[0], "0123-uuid");
    EXPECT_EQ(*values[1], "1700000000123456");
    EXPECT_FALSE(values[2].has_value());
    EXPECT_EQ(*values[3], "abc");
    EXPECT_DOUBLE_EQ(std::stod(*values[4]), 0.1);
    EXPECT_EQ(*values[5], "{\"a\":1}");
}

TEST(FormatFloat8Test, SpecialValues) {
    EXPECT_EQ(FormatFloat8(std::numeric_limits<double>::quiet_NaN()), "NaN");
    EXPECT_EQ(FormatFloat8(std::numeric_limits<double>::infinity()), "Infinity");
    EXPECT_EQ(FormatFloat8(-std::numeric_limits<double>::infinity()), "-Infinity");
    EXPECT_EQ(std::stod(FormatFloat8(0.1 + 0.2)), 0.1 + 0.2);
}

TEST(RecordTablesTest, InsertSqlNumbersParametersRowMajor) {
    std::vector<Column> columns = {{"id", ColumnKind::UUID}, {"ts", ColumnKind::TIMESTAMP},
                                   {"v", ColumnKind::FLOAT8}};
    auto sql = BuildInsertSql("t", columns, 2);
    EXPECT_EQ(sql,
              "INSERT INTO t (id, ts, v) VALUES "
              "($1::uuid, TIMESTAMPTZ 'epoch' + $2::bigint * INTERVAL '1 microsecond', $3::float8), "
              "($4::uuid, TIMESTAMPTZ 'epoch' + $5::bigint * INTERVAL '1 microsecond', $6::float8)");
}

TEST(RecordTablesTest, CopySqlUsesBinaryFormat) {
    EXPECT_EQ(BuildCopySql("logs", RecordTable<core::LogRecord>::Columns()),
              "COPY logs (id, \"timestamp\", trace_id, span_id, severity, body, attributes, service_name) "
              "FROM STDIN (FORMAT BINARY)");
}

TEST(RecordTablesTest, TracesNeverWriteGeneratedDuration) {
    for (const auto& column : RecordTable<core::SpanRecord>::Columns()) {
        EXPECT_STRNE(column.name, "duration_ms");
    }
}

TEST(RecordTablesTest, SelectListsReadTimestampsAsEpochMicros) {
    EXPECT_STREQ(RecordTable<core::LogRecord>::kSelect,
                 "id::text, (EXTRACT(EPOCH FROM \"timestamp\") * 1000000)::bigint, trace_id, span_id, "
                 "severity, body, attributes::text");
    EXPECT_STREQ(RecordTable<core::SpanRecord>::kSelect,
                 "id::text, trace_id, span_id, parent_span_id, name, "
                 "(EXTRACT(EPOCH FROM start_time) * 1000000)::bigint, "
                 "(EXTRACT(EPOCH FROM end_time) * 1000000)::bigint, "
                 "attributes::text, status");
    EXPECT_STREQ(RecordTable<core::MetricRecord>::kSelect,
                 "id::text, name, (EXTRACT(EPOCH FROM \"timestamp\") * 1000000)::bigint, value, "
                 "attributes::text");
}

TEST(RecordTablesTest, ContainsPatternEscapesLikeMetacharacters) {
    EXPECT_EQ(ContainsPattern("error"), "%error%");
    EXPECT_EQ(ContainsPattern("50%_off\\"), "%50\\%\\_off\\\\%");
    EXPECT_EQ(ContainsPattern(""), "%%");
}

class RecordingSink : public FieldSink {
public:
    void add_uuid(const std::string& v) override { fields.push_back("uuid:" + v); }
    void add_timestamp(core::Timestamp v) override { fields.push_back("ts:" + std::to_string(v)); }
    void add_text(const std::string& v) override { fields.push_back("text:" + v); }
    void add_optional_text(const std::string& v) override { fields.push_back("opt:" + v); }
    void add_float8(double v) override { fields.push_back("f8:" + FormatFloat8(v)); }
    void add_jsonb(const std::string& v) override { fields.push_back("json:" + v); }

    std::vector<std::string> fields;
};

TEST(RecordTablesTest, MetricEncodeProjectsServiceName) {
    auto metric = testutil::MakeMetric(42, "queue.depth", 3.0);
    RecordingSink sink;
    RecordTable<core::MetricRecord>::Encode(metric, sink);

    ASSERT_EQ(sink.fields.size(), RecordTable<core::MetricRecord>::Columns().size());
    EXPECT_EQ(sink.fields[0], "uuid:" + metric.id);
    EXPECT_EQ(sink.fields[1], "text:queue.depth");
    EXPECT_EQ(sink.fields[2], "ts:42");
    EXPECT_EQ(sink.fields[3], "f8:3");
    EXPECT_EQ(sink.fields[4], "json:{\"service.name\":\"test-service\"}");
    EXPECT_EQ(sink.fields[5], "text:test-service");
}

TEST(RecordTablesTest, SpanEncodeMatchesColumnCount) {
    auto span = testutil::MakeSpan("abc", 1, 2);
    RecordingSink sink;
    RecordTable<core::SpanRecord>::Encode(span, sink);
    EXPECT_EQ(sink.fields.size(), RecordTable<core::SpanRecord>::Columns().size());
    EXPECT_EQ(sink.fields[3], "opt:");
}

} // namespace
} // namespace pg
} // namespace storage
} // namespace apptrace
