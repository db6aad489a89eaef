#ifndef APPTRACE_OTEL_INGESTION_SERVICE_H_
#define APPTRACE_OTEL_INGESTION_SERVICE_H_

#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include "opentelemetry/proto/collector/logs/v1/logs_service.grpc.pb.h"
#include "opentelemetry/proto/collector/metrics/v1/metrics_service.grpc.pb.h"
#include "opentelemetry/proto/collector/trace/v1/trace_service.grpc.pb.h"

#include "apptrace/common/logger.h"
#include "apptrace/storage/storage.h"

namespace apptrace {
namespace otel {

/**
 * @brief Result of ingesting one export batch
 *
 * Rejection is all-or-nothing: either nothing was rejected, or the whole
 * batch was, with the triggering error message.
 */
struct IngestOutcome {
    int64_t rejected = 0;
    std::string error_message;

    bool ok() const { return rejected == 0 && error_message.empty(); }
};

/**
 * @brief Decode a batch and hand it to the store in a single insert_batch call
 *
 * @param decode  Request -> std::vector<Record>, may throw
 * @param count   Request -> entry count, used when decoding fails
 * @param insert  const std::vector<Record>& -> core::Result<void>
 * @param noun    Entry name for the processed-count log line
 */
template<typename Request, typename Decode, typename Count, typename Insert>
IngestOutcome IngestBatch(const Request& request, Decode decode, Count count, Insert insert,
                          const char* noun) {
    IngestOutcome outcome;
    try {
        auto records = decode(request);
        auto result = insert(records);
        if (!result.ok()) {
            outcome.rejected = static_cast<int64_t>(records.size());
            outcome.error_message = result.error();
            APPTRACE_ERROR("Failed to store {} {}: {}", records.size(), noun, outcome.error_message);
            return outcome;
        }
        APPTRACE_INFO("Processed {} {}", records.size(), noun);
    } catch (const std::exception& e) {
        outcome.rejected = count(request);
        outcome.error_message = e.what();
        APPTRACE_ERROR("Error processing {} export request: {}", noun, e.what());
    }
    return outcome;
}

/**
 * @brief OTLP LogsService backed by a LogStore
 */
class LogsService : public opentelemetry::proto::collector::logs::v1::LogsService::Service {
public:
    explicit LogsService(std::shared_ptr<storage::LogStore> store);

    grpc::Status Export(
        grpc::ServerContext* context,
        const opentelemetry::proto::collector::logs::v1::ExportLogsServiceRequest* request,
        opentelemetry::proto::collector::logs::v1::ExportLogsServiceResponse* response) override;

    IngestOutcome Ingest(
        const opentelemetry::proto::collector::logs::v1::ExportLogsServiceRequest& request);

private:
    std::shared_ptr<storage::LogStore> store_;
};

/**
 * @brief OTLP TraceService backed by a SpanStore
 */
class TraceService : public opentelemetry::proto::collector::trace::v1::TraceService::Service {
public:
    explicit TraceService(std::shared_ptr<storage::SpanStore> store);

    grpc::Status Export(
        grpc::ServerContext* context,
        const opentelemetry::proto::collector::trace::v1::ExportTraceServiceRequest* request,
        opentelemetry::proto::collector::trace::v1::ExportTraceServiceResponse* response) override;

    IngestOutcome Ingest(
        const opentelemetry::proto::collector::trace::v1::ExportTraceServiceRequest& request);

private:
    std::shared_ptr<storage::SpanStore> store_;
};

/**
 * @brief OTLP MetricsService backed by a MetricStore
 */
class MetricsService : public opentelemetry::proto::collector::metrics::v1::MetricsService::Service {
public:
    explicit MetricsService(std::shared_ptr<storage::MetricStore> store);

    grpc::Status Export(
        grpc::ServerContext* context,
        const opentelemetry::proto::collector::metrics::v1::ExportMetricsServiceRequest* request,
        opentelemetry::proto::collector::metrics::v1::ExportMetricsServiceResponse* response) override;

    IngestOutcome Ingest(
        const opentelemetry::proto::collector::metrics::v1::ExportMetricsServiceRequest& request);

private:
    std::shared_ptr<storage::MetricStore> store_;
};

} // namespace otel
} // namespace apptrace

#endif // APPTRACE_OTEL_INGESTION_SERVICE_H_
