#include "apptrace/otel/ingestion_service.h"
#include "apptrace/otel/decoder.h"

namespace apptrace {
namespace otel {

namespace collector_metrics = opentelemetry::proto::collector::metrics::v1;

MetricsService::MetricsService(std::shared_ptr<storage::MetricStore> store)
    : store_(std::move(store)) {}

IngestOutcome MetricsService::Ingest(const collector_metrics::ExportMetricsServiceRequest& request) {
    return IngestBatch(
        request,
        [](const collector_metrics::ExportMetricsServiceRequest& r) { return DecodeMetrics(r); },
        [](const collector_metrics::ExportMetricsServiceRequest& r) { return CountDataPoints(r); },
        [this](const std::vector<core::MetricRecord>& records) { return store_->insert_batch(records); },
        "metric data points");
}

grpc::Status MetricsService::Export(
    grpc::ServerContext* context [[maybe_unused]],
    const collector_metrics::ExportMetricsServiceRequest* request,
    collector_metrics::ExportMetricsServiceResponse* response) {
    APPTRACE_DEBUG("Received metrics export request with {} resource metrics",
                   request->resource_metrics_size());

    auto outcome = Ingest(*request);
    auto* partial = response->mutable_partial_success();
    partial->set_rejected_data_points(outcome.rejected);
    partial->set_error_message(outcome.error_message);
    return grpc::Status::OK;
}

} // namespace otel
} // namespace apptrace
