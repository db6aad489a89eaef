#pragma once

#include <string>
#include <vector>

#include "opentelemetry/proto/collector/logs/v1/logs_service.pb.h"
#include "opentelemetry/proto/collector/metrics/v1/metrics_service.pb.h"
#include "opentelemetry/proto/collector/trace/v1/trace_service.pb.h"
#include "opentelemetry/proto/common/v1/common.pb.h"
#include "opentelemetry/proto/resource/v1/resource.pb.h"

#include "apptrace/core/types.h"

namespace apptrace {
namespace testutil {

inline void AddStringAttribute(
    google::protobuf::RepeatedPtrField<opentelemetry::proto::common::v1::KeyValue>* attributes,
    const std::string& key, const std::string& value) {
    auto* kv = attributes->Add();
    kv->set_key(key);
    kv->mutable_value()->set_string_value(value);
}

inline void SetServiceName(opentelemetry::proto::resource::v1::Resource* resource,
                           const std::string& service_name) {
    AddStringAttribute(resource->mutable_attributes(), "service.name", service_name);
}

// One resource, one scope, one log record per (severity, body) pair.
inline opentelemetry::proto::collector::logs::v1::ExportLogsServiceRequest MakeLogsRequest(
    const std::string& service_name,
    const std::vector<std::pair<std::string, std::string>>& entries,
    uint64_t base_time_nanos = 1700000000000000000ULL) {
    opentelemetry::proto::collector::logs::v1::ExportLogsServiceRequest request;
    auto* resource_logs = request.add_resource_logs();
    if (!service_name.empty()) {
        SetServiceName(resource_logs->mutable_resource(), service_name);
    }
    auto* scope_logs = resource_logs->add_scope_logs();
    uint64_t time = base_time_nanos;
    for (const auto& [severity, body] : entries) {
        auto* log = scope_logs->add_log_records();
        log->set_time_unix_nano(time);
        log->set_severity_text(severity);
        log->mutable_body()->set_string_value(body);
        time += 1000000;
    }
    return request;
}

inline opentelemetry::proto::collector::trace::v1::ExportTraceServiceRequest MakeTraceRequest(
    const std::string& service_name, const std::string& trace_id_bytes, int span_count) {
    opentelemetry::proto::collector::trace::v1::ExportTraceServiceRequest request;
    auto* resource_spans = request.add_resource_spans();
    SetServiceName(resource_spans->mutable_resource(), service_name);
    auto* scope_spans = resource_spans->add_scope_spans();
    for (int i = 0; i < span_count; i++) {
        auto* span = scope_spans->add_spans();
        span->set_trace_id(trace_id_bytes);
        span->set_span_id(std::string(7, '\0') + static_cast<char>(i + 1));
        span->set_name("span-" + std::to_string(i));
        span->set_start_time_unix_nano(1700000000000000000ULL + static_cast<uint64_t>(i) * 1000000ULL);
        span->set_end_time_unix_nano(1700000000000000000ULL + static_cast<uint64_t>(i + 1) * 1000000ULL);
    }
    return request;
}

inline core::LogRecord MakeLog(core::Timestamp timestamp, const std::string& body,
                               const std::string& service_name = "test-service") {
    core::LogRecord record;
    record.id = core::GenerateRecordId();
    record.timestamp = timestamp;
    record.severity = "INFO";
    record.body = body;
    record.attributes[core::kServiceNameKey] = service_name;
    return record;
}

inline core::SpanRecord MakeSpan(const std::string& trace_id, core::Timestamp start,
                                 core::Timestamp end, const std::string& name = "op") {
    core::SpanRecord record;
    record.id = core::GenerateRecordId();
    record.trace_id = trace_id;
    record.span_id = core::HexEncode(core::GenerateRecordId().substr(0, 8));
    record.name = name;
    record.start_time = start;
    record.end_time = end;
    record.attributes[core::kServiceNameKey] = std::string("test-service");
    return record;
}

inline core::MetricRecord MakeMetric(core::Timestamp timestamp, const std::string& name, double value) {
    core::MetricRecord record;
    record.id = core::GenerateRecordId();
    record.name = name;
    record.timestamp = timestamp;
    record.value = value;
    record.attributes[core::kServiceNameKey] = std::string("test-service");
    return record;
}

} // namespace testutil
} // namespace apptrace
