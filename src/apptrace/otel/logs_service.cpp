#include "apptrace/otel/ingestion_service.h"
#include "apptrace/otel/decoder.h"

namespace apptrace {
namespace otel {

namespace collector_logs = opentelemetry::proto::collector::logs::v1;

LogsService::LogsService(std::shared_ptr<storage::LogStore> store)
    : store_(std::move(store)) {}

IngestOutcome LogsService::Ingest(const collector_logs::ExportLogsServiceRequest& request) {
    return IngestBatch(
        request,
        [](const collector_logs::ExportLogsServiceRequest& r) { return DecodeLogs(r); },
        [](const collector_logs::ExportLogsServiceRequest& r) { return CountLogRecords(r); },
        [this](const std::vector<core::LogRecord>& records) { return store_->insert_batch(records); },
        "log records");
}

grpc::Status LogsService::Export(
    grpc::ServerContext* context [[maybe_unused]],
    const collector_logs::ExportLogsServiceRequest* request,
    collector_logs::ExportLogsServiceResponse* response) {
    APPTRACE_DEBUG("Received logs export request with {} resource logs", request->resource_logs_size());

    auto outcome = Ingest(*request);
    auto* partial = response->mutable_partial_success();
    partial->set_rejected_log_records(outcome.rejected);
    partial->set_error_message(outcome.error_message);
    return grpc::Status::OK;
}

} // namespace otel
} // namespace apptrace
