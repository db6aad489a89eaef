#include "apptrace/otel/decoder.h"
#include "apptrace/common/logger.h"

#include <cmath>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace apptrace {
namespace otel {

namespace logs_pb = opentelemetry::proto::logs::v1;
namespace metrics_pb = opentelemetry::proto::metrics::v1;
namespace trace_pb = opentelemetry::proto::trace::v1;
namespace resource_pb = opentelemetry::proto::resource::v1;

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

// PostgreSQL text and jsonb cannot hold U+0000; drop it on every backend.
std::string CleanText(const std::string& text) {
    if (text.find('\0') == std::string::npos) {
        return text;
    }
    std::string cleaned;
    cleaned.reserve(text.size());
    for (char c : text) {
        if (c != '\0') {
            cleaned.push_back(c);
        }
    }
    return cleaned;
}

void WriteJsonString(JsonWriter& writer, const std::string& text) {
    auto cleaned = CleanText(text);
    writer.String(cleaned.c_str(), static_cast<rapidjson::SizeType>(cleaned.size()));
}

void WriteJson(JsonWriter& writer, const common_pb::AnyValue& value) {
    switch (value.value_case()) {
        case common_pb::AnyValue::kStringValue:
            WriteJsonString(writer, value.string_value());
            break;
        case common_pb::AnyValue::kBoolValue:
            writer.Bool(value.bool_value());
            break;
        case common_pb::AnyValue::kIntValue:
            writer.Int64(value.int_value());
            break;
        case common_pb::AnyValue::kDoubleValue:
            if (std::isfinite(value.double_value())) {
                writer.Double(value.double_value());
            } else {
                auto text = core::AttributeToString(value.double_value());
                writer.String(text.c_str(), static_cast<rapidjson::SizeType>(text.size()));
            }
            break;
        case common_pb::AnyValue::kBytesValue: {
            auto hex = core::HexEncode(value.bytes_value());
            writer.String(hex.c_str(), static_cast<rapidjson::SizeType>(hex.size()));
            break;
        }
        case common_pb::AnyValue::kArrayValue:
            writer.StartArray();
            for (const auto& element : value.array_value().values()) {
                WriteJson(writer, element);
            }
            writer.EndArray();
            break;
        case common_pb::AnyValue::kKvlistValue:
            writer.StartObject();
            for (const auto& kv : value.kvlist_value().values()) {
                auto key = CleanText(kv.key());
                writer.Key(key.c_str(), static_cast<rapidjson::SizeType>(key.size()));
                WriteJson(writer, kv.value());
            }
            writer.EndObject();
            break;
        default:
            writer.Null();
            break;
    }
}

std::string ToJsonLike(const common_pb::AnyValue& value) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    WriteJson(writer, value);
    return std::string(buffer.GetString(), buffer.GetSize());
}

/**
 * @brief Attributes inherited by every record of one resource group
 */
core::Attributes ResourceAttributes(const resource_pb::Resource& resource) {
    auto attributes = DecodeAttributes(resource.attributes());
    if (attributes.find(core::kServiceNameKey) == attributes.end()) {
        attributes[core::kServiceNameKey] = std::string(core::kUnknownServiceName);
    }
    return attributes;
}

// Record attributes take precedence over the resource attributes.
core::Attributes MergeAttributes(
    const core::Attributes& resource_attributes,
    const google::protobuf::RepeatedPtrField<common_pb::KeyValue>& own) {
    auto merged = resource_attributes;
    for (const auto& kv : own) {
        merged[CleanText(kv.key())] = DecodeAnyValue(kv.value());
    }
    return merged;
}

std::string SeverityName(int32_t number) {
    if (number <= 0) return "";
    if (number <= 4) return "TRACE";
    if (number <= 8) return "DEBUG";
    if (number <= 12) return "INFO";
    if (number <= 16) return "WARN";
    if (number <= 20) return "ERROR";
    return "FATAL";
}

std::string StatusName(const trace_pb::Span& span) {
    if (span.has_status() &&
        span.status().code() == trace_pb::Status::STATUS_CODE_ERROR) {
        return "ERROR";
    }
    return core::kDefaultSpanStatus;
}

double NumberValue(const metrics_pb::NumberDataPoint& point) {
    switch (point.value_case()) {
        case metrics_pb::NumberDataPoint::kAsDouble:
            return point.as_double();
        case metrics_pb::NumberDataPoint::kAsInt:
            return static_cast<double>(point.as_int());
        default:
            return 0.0;
    }
}

core::MetricRecord NumberRecord(const std::string& name,
                                const metrics_pb::NumberDataPoint& point,
                                const core::Attributes& resource_attributes) {
    core::MetricRecord record;
    record.id = core::GenerateRecordId();
    record.name = name;
    record.timestamp = core::NanosToTimestamp(point.time_unix_nano());
    record.value = NumberValue(point);
    record.attributes = MergeAttributes(resource_attributes, point.attributes());
    return record;
}

core::MetricRecord HistogramRecord(const std::string& name,
                                   const metrics_pb::HistogramDataPoint& point,
                                   const core::Attributes& resource_attributes) {
    core::MetricRecord record;
    record.id = core::GenerateRecordId();
    record.name = name + "_histogram";
    record.timestamp = core::NanosToTimestamp(point.time_unix_nano());
    record.value = point.sum();
    record.attributes = MergeAttributes(resource_attributes, point.attributes());
    record.attributes["histogram.count"] = static_cast<int64_t>(point.count());
    record.attributes["histogram.sum"] = point.sum();
    return record;
}

} // namespace

core::AttributeValue DecodeAnyValue(const common_pb::AnyValue& value) {
    switch (value.value_case()) {
        case common_pb::AnyValue::kStringValue:
            return CleanText(value.string_value());
        case common_pb::AnyValue::kBoolValue:
            return value.bool_value();
        case common_pb::AnyValue::kIntValue:
            return static_cast<int64_t>(value.int_value());
        case common_pb::AnyValue::kDoubleValue:
            return value.double_value();
        case common_pb::AnyValue::kBytesValue: {
            const auto& bytes = value.bytes_value();
            return core::Bytes(bytes.begin(), bytes.end());
        }
        case common_pb::AnyValue::kArrayValue:
        case common_pb::AnyValue::kKvlistValue:
            return ToJsonLike(value);
        default:
            return std::string();
    }
}

std::string AnyValueToString(const common_pb::AnyValue& value) {
    switch (value.value_case()) {
        case common_pb::AnyValue::kArrayValue:
        case common_pb::AnyValue::kKvlistValue:
            return ToJsonLike(value);
        case common_pb::AnyValue::VALUE_NOT_SET:
            return std::string();
        default:
            return core::AttributeToString(DecodeAnyValue(value));
    }
}

core::Attributes DecodeAttributes(
    const google::protobuf::RepeatedPtrField<common_pb::KeyValue>& attributes) {
    core::Attributes decoded;
    for (const auto& kv : attributes) {
        decoded[CleanText(kv.key())] = DecodeAnyValue(kv.value());
    }
    return decoded;
}

std::vector<core::LogRecord> DecodeLogs(
    const opentelemetry::proto::collector::logs::v1::ExportLogsServiceRequest& request) {
    std::vector<core::LogRecord> records;
    records.reserve(static_cast<size_t>(CountLogRecords(request)));

    for (const auto& resource_logs : request.resource_logs()) {
        auto resource_attributes = ResourceAttributes(resource_logs.resource());
        for (const auto& scope_logs : resource_logs.scope_logs()) {
            for (const auto& log : scope_logs.log_records()) {
                core::LogRecord record;
                record.id = core::GenerateRecordId();
                record.timestamp = core::NanosToTimestamp(
                    log.time_unix_nano() != 0 ? log.time_unix_nano() : log.observed_time_unix_nano());
                record.trace_id = core::HexEncode(log.trace_id());
                record.span_id = core::HexEncode(log.span_id());
                record.severity = !log.severity_text().empty()
                    ? CleanText(log.severity_text())
                    : SeverityName(static_cast<int32_t>(log.severity_number()));
                record.body = AnyValueToString(log.body());
                record.attributes = MergeAttributes(resource_attributes, log.attributes());
                records.push_back(std::move(record));
            }
        }
    }
    return records;
}

std::vector<core::SpanRecord> DecodeSpans(
    const opentelemetry::proto::collector::trace::v1::ExportTraceServiceRequest& request) {
    std::vector<core::SpanRecord> records;
    records.reserve(static_cast<size_t>(CountSpans(request)));

    for (const auto& resource_spans : request.resource_spans()) {
        auto resource_attributes = ResourceAttributes(resource_spans.resource());
        for (const auto& scope_spans : resource_spans.scope_spans()) {
            for (const auto& span : scope_spans.spans()) {
                core::SpanRecord record;
                record.id = core::GenerateRecordId();
                record.trace_id = core::HexEncode(span.trace_id());
                record.span_id = core::HexEncode(span.span_id());
                record.parent_span_id = core::HexEncode(span.parent_span_id());
                record.name = CleanText(span.name());
                record.start_time = core::NanosToTimestamp(span.start_time_unix_nano());
                record.end_time = core::NanosToTimestamp(span.end_time_unix_nano());
                if (record.end_time < record.start_time) {
                    APPTRACE_DEBUG("Span {} ends before it starts, clamping end time", record.span_id);
                    record.end_time = record.start_time;
                }
                record.attributes = MergeAttributes(resource_attributes, span.attributes());
                record.status = StatusName(span);
                records.push_back(std::move(record));
            }
        }
    }
    return records;
}

std::vector<core::MetricRecord> DecodeMetrics(
    const opentelemetry::proto::collector::metrics::v1::ExportMetricsServiceRequest& request) {
    std::vector<core::MetricRecord> records;

    for (const auto& resource_metrics : request.resource_metrics()) {
        auto resource_attributes = ResourceAttributes(resource_metrics.resource());
        for (const auto& scope_metrics : resource_metrics.scope_metrics()) {
            for (const auto& metric : scope_metrics.metrics()) {
                auto name = CleanText(metric.name());
                switch (metric.data_case()) {
                    case metrics_pb::Metric::kGauge:
                        for (const auto& point : metric.gauge().data_points()) {
                            records.push_back(NumberRecord(name, point, resource_attributes));
                        }
                        break;
                    case metrics_pb::Metric::kSum:
                        for (const auto& point : metric.sum().data_points()) {
                            records.push_back(NumberRecord(name, point, resource_attributes));
                        }
                        break;
                    case metrics_pb::Metric::kHistogram:
                        for (const auto& point : metric.histogram().data_points()) {
                            records.push_back(HistogramRecord(name, point, resource_attributes));
                        }
                        break;
                    default:
                        APPTRACE_WARN("Unsupported metric type for {}", name);
                        break;
                }
            }
        }
    }
    return records;
}

int64_t CountLogRecords(
    const opentelemetry::proto::collector::logs::v1::ExportLogsServiceRequest& request) {
    int64_t count = 0;
    for (const auto& resource_logs : request.resource_logs()) {
        for (const auto& scope_logs : resource_logs.scope_logs()) {
            count += scope_logs.log_records_size();
        }
    }
    return count;
}

int64_t CountSpans(
    const opentelemetry::proto::collector::trace::v1::ExportTraceServiceRequest& request) {
    int64_t count = 0;
    for (const auto& resource_spans : request.resource_spans()) {
        for (const auto& scope_spans : resource_spans.scope_spans()) {
            count += scope_spans.spans_size();
        }
    }
    return count;
}

int64_t CountDataPoints(
    const opentelemetry::proto::collector::metrics::v1::ExportMetricsServiceRequest& request) {
    int64_t count = 0;
    for (const auto& resource_metrics : request.resource_metrics()) {
        for (const auto& scope_metrics : resource_metrics.scope_metrics()) {
            for (const auto& metric : scope_metrics.metrics()) {
                switch (metric.data_case()) {
                    case metrics_pb::Metric::kGauge:
                        count += metric.gauge().data_points_size();
                        break;
                    case metrics_pb::Metric::kSum:
                        count += metric.sum().data_points_size();
                        break;
                    case metrics_pb::Metric::kHistogram:
                        count += metric.histogram().data_points_size();
                        break;
                    default:
                        break;
                }
            }
        }
    }
    return count;
}

} // namespace otel
} // namespace apptrace
