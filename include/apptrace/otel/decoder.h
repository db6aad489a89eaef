#ifndef APPTRACE_OTEL_DECODER_H_
#define APPTRACE_OTEL_DECODER_H_

#include <cstdint>
#include <string>
#include <vector>

#include <google/protobuf/repeated_field.h>
#include "opentelemetry/proto/collector/logs/v1/logs_service.pb.h"
#include "opentelemetry/proto/collector/metrics/v1/metrics_service.pb.h"
#include "opentelemetry/proto/collector/trace/v1/trace_service.pb.h"
#include "opentelemetry/proto/common/v1/common.pb.h"

#include "apptrace/core/types.h"

namespace apptrace {
namespace otel {

namespace common_pb = opentelemetry::proto::common::v1;

// Every decoded string has U+0000 removed.

/**
 * @brief Flatten an OTLP logs export into log records
 *
 * Records keep request order (resource, scope, entry). Each record carries
 * the resource attributes, overridden by its own attributes, and always a
 * service.name (defaulting to "unknown").
 */
std::vector<core::LogRecord> DecodeLogs(
    const opentelemetry::proto::collector::logs::v1::ExportLogsServiceRequest& request);

/**
 * @brief Flatten an OTLP trace export into span records
 *
 * An end time before the start time is clamped to the start time.
 */
std::vector<core::SpanRecord> DecodeSpans(
    const opentelemetry::proto::collector::trace::v1::ExportTraceServiceRequest& request);

/**
 * @brief Flatten an OTLP metrics export into one record per data point
 *
 * Gauge and sum points map directly. A histogram point becomes a single
 * "<name>_histogram" record whose value is the sum, with histogram.count
 * and histogram.sum attributes. Other metric shapes are skipped.
 */
std::vector<core::MetricRecord> DecodeMetrics(
    const opentelemetry::proto::collector::metrics::v1::ExportMetricsServiceRequest& request);

// Entry counts taken from the request structure alone.
int64_t CountLogRecords(
    const opentelemetry::proto::collector::logs::v1::ExportLogsServiceRequest& request);
int64_t CountSpans(
    const opentelemetry::proto::collector::trace::v1::ExportTraceServiceRequest& request);
int64_t CountDataPoints(
    const opentelemetry::proto::collector::metrics::v1::ExportMetricsServiceRequest& request);

/**
 * @brief Map an AnyValue onto the attribute sum type
 *
 * kvlist and array values become their JSON-like text; unset becomes "".
 */
core::AttributeValue DecodeAnyValue(const common_pb::AnyValue& value);

/**
 * @brief Render an AnyValue as text (log bodies, nested values)
 */
std::string AnyValueToString(const common_pb::AnyValue& value);

core::Attributes DecodeAttributes(
    const google::protobuf::RepeatedPtrField<common_pb::KeyValue>& attributes);

} // namespace otel
} // namespace apptrace

#endif // APPTRACE_OTEL_DECODER_H_
