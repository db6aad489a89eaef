#include "apptrace/otel/ingestion_service.h"
#include "apptrace/otel/decoder.h"

namespace apptrace {
namespace otel {

namespace collector_trace = opentelemetry::proto::collector::trace::v1;

TraceService::TraceService(std::shared_ptr<storage::SpanStore> store)
    : store_(std::move(store)) {}

IngestOutcome TraceService::Ingest(const collector_trace::ExportTraceServiceRequest& request) {
    return IngestBatch(
        request,
        [](const collector_trace::ExportTraceServiceRequest& r) { return DecodeSpans(r); },
        [](const collector_trace::ExportTraceServiceRequest& r) { return CountSpans(r); },
        [this](const std::vector<core::SpanRecord>& records) { return store_->insert_batch(records); },
        "spans");
}

grpc::Status TraceService::Export(
    grpc::ServerContext* context [[maybe_unused]],
    const collector_trace::ExportTraceServiceRequest* request,
    collector_trace::ExportTraceServiceResponse* response) {
    APPTRACE_DEBUG("Received trace export request with {} resource spans", request->resource_spans_size());

    auto outcome = Ingest(*request);
    auto* partial = response->mutable_partial_success();
    partial->set_rejected_spans(outcome.rejected);
    partial->set_error_message(outcome.error_message);
    return grpc::Status::OK;
}

} // namespace otel
} // namespace apptrace
