#include "apptrace/server/query_handler.h"
#include "apptrace/core/error.h"
#include "apptrace/storage/attribute_json.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <ctime>

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace apptrace {
namespace server {

namespace {

using Allocator = rapidjson::Document::AllocatorType;

rapidjson::Value JsonString(const std::string& text, Allocator& allocator) {
    return rapidjson::Value(text.c_str(), static_cast<rapidjson::SizeType>(text.size()), allocator);
}

// NaN and infinities have no JSON number form; they go out as strings.
rapidjson::Value JsonDouble(double value, Allocator& allocator) {
    if (std::isfinite(value)) {
        return rapidjson::Value(value);
    }
    return JsonString(core::AttributeToString(value), allocator);
}

rapidjson::Value ToJson(const core::LogRecord& record, Allocator& allocator) {
    rapidjson::Value object(rapidjson::kObjectType);
    object.AddMember("id", JsonString(record.id, allocator), allocator);
    object.AddMember("timestamp", static_cast<int64_t>(record.timestamp), allocator);
    object.AddMember("trace_id", JsonString(record.trace_id, allocator), allocator);
    object.AddMember("span_id", JsonString(record.span_id, allocator), allocator);
    object.AddMember("severity", JsonString(record.severity, allocator), allocator);
    object.AddMember("body", JsonString(record.body, allocator), allocator);
    object.AddMember("attributes", storage::AttributesToJson(record.attributes, allocator), allocator);
    return object;
}

rapidjson::Value ToJson(const core::SpanRecord& record, Allocator& allocator) {
    rapidjson::Value object(rapidjson::kObjectType);
    object.AddMember("id", JsonString(record.id, allocator), allocator);
    object.AddMember("trace_id", JsonString(record.trace_id, allocator), allocator);
    object.AddMember("span_id", JsonString(record.span_id, allocator), allocator);
    object.AddMember("parent_span_id", JsonString(record.parent_span_id, allocator), allocator);
    object.AddMember("name", JsonString(record.name, allocator), allocator);
    object.AddMember("start_time", static_cast<int64_t>(record.start_time), allocator);
    object.AddMember("end_time", static_cast<int64_t>(record.end_time), allocator);
    object.AddMember("duration_ms", static_cast<double>(record.duration()) / 1000.0, allocator);
    object.AddMember("status", JsonString(record.status, allocator), allocator);
    object.AddMember("attributes", storage::AttributesToJson(record.attributes, allocator), allocator);
    return object;
}

rapidjson::Value ToJson(const core::MetricRecord& record, Allocator& allocator) {
    rapidjson::Value object(rapidjson::kObjectType);
    object.AddMember("id", JsonString(record.id, allocator), allocator);
    object.AddMember("name", JsonString(record.name, allocator), allocator);
    object.AddMember("timestamp", static_cast<int64_t>(record.timestamp), allocator);
    object.AddMember("value", JsonDouble(record.value, allocator), allocator);
    object.AddMember("attributes", storage::AttributesToJson(record.attributes, allocator), allocator);
    return object;
}

std::string Serialize(const rapidjson::Document& doc) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

template<typename Record>
void WriteRecords(core::Result<std::vector<Record>> result, size_t limit, size_t offset,
                  Response& response) {
    if (!result.ok()) {
        response.status = 500;
        response.body = ErrorJson(result.error());
        return;
    }

    rapidjson::Document doc;
    doc.SetObject();
    auto& allocator = doc.GetAllocator();

    rapidjson::Value data(rapidjson::kArrayType);
    for (const auto& record : result.value()) {
        data.PushBack(ToJson(record, allocator), allocator);
    }
    doc.AddMember("data", data, allocator);
    doc.AddMember("limit", static_cast<uint64_t>(limit), allocator);
    doc.AddMember("offset", static_cast<uint64_t>(offset), allocator);
    response.body = Serialize(doc);
}

std::string CurrentTimeIso8601() {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    char result[40];
    std::snprintf(result, sizeof(result), "%s.%03lldZ", buffer, static_cast<long long>(millis));
    return result;
}

} // namespace

size_t ParseSizeParam(const Request& request, const std::string& name, size_t default_value) {
    if (!request.HasParam(name)) {
        return default_value;
    }
    auto value = request.GetParam(name);
    if (value.empty() || value.size() > 18 ||
        !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw core::InvalidArgumentError("Invalid value for '" + name + "': " + value);
    }
    return static_cast<size_t>(std::stoull(value));
}

QueryHandler::QueryHandler(storage::StorageBackends backends)
    : backends_(std::move(backends)) {}

void QueryHandler::Register(HttpServer& server) {
    server.RegisterHandler("/", [this](const Request& req, Response& res) { HandleRoot(req, res); });
    server.RegisterHandler("/health", [this](const Request& req, Response& res) { HandleHealth(req, res); });
    server.RegisterHandler("/api/logs", [this](const Request& req, Response& res) { HandleLogs(req, res); });
    server.RegisterHandler("/api/logs/search",
                           [this](const Request& req, Response& res) { HandleLogSearch(req, res); });
    server.RegisterHandler("/api/traces", [this](const Request& req, Response& res) { HandleTraces(req, res); });
    server.RegisterHandler("/api/traces/:trace_id",
                           [this](const Request& req, Response& res) { HandleTrace(req, res); });
    server.RegisterHandler("/api/metrics", [this](const Request& req, Response& res) { HandleMetrics(req, res); });
    server.RegisterHandler("/api/metrics/search",
                           [this](const Request& req, Response& res) { HandleMetricSearch(req, res); });
}

void QueryHandler::HandleRoot(const Request& /*request*/, Response& response) {
    response.content_type = "text/plain";
    response.body = "AppTrace Collector is running. gRPC services available on port 4317.";
}

void QueryHandler::HandleHealth(const Request& /*request*/, Response& response) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& allocator = doc.GetAllocator();
    doc.AddMember("status", "Healthy", allocator);
    doc.AddMember("timestamp", JsonString(CurrentTimeIso8601(), allocator), allocator);
    doc.AddMember("storage", JsonString(core::StorageTypeName(backends_.type), allocator), allocator);
    response.body = Serialize(doc);
}

void QueryHandler::HandleLogs(const Request& request, Response& response) {
    auto limit = ParseSizeParam(request, "limit", kDefaultLimit);
    auto offset = ParseSizeParam(request, "offset", 0);
    WriteRecords(backends_.logs->get_page(limit, offset), limit, offset, response);
}

void QueryHandler::HandleLogSearch(const Request& request, Response& response) {
    auto limit = ParseSizeParam(request, "limit", kDefaultLimit);
    auto offset = ParseSizeParam(request, "offset", 0);
    WriteRecords(backends_.logs->search(request.GetParam("q"), limit, offset), limit, offset, response);
}

void QueryHandler::HandleTraces(const Request& request, Response& response) {
    auto limit = ParseSizeParam(request, "limit", kDefaultLimit);
    auto offset = ParseSizeParam(request, "offset", 0);
    WriteRecords(backends_.spans->get_page(limit, offset), limit, offset, response);
}

void QueryHandler::HandleTrace(const Request& request, Response& response) {
    auto trace_id = request.GetPathParam("trace_id");
    if (trace_id.empty()) {
        throw core::InvalidArgumentError("Missing trace id");
    }
    // Stored ids are lowercase hex.
    std::transform(trace_id.begin(), trace_id.end(), trace_id.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto spans = backends_.spans->get_by_trace_id(trace_id);
    size_t count = spans.ok() ? spans.value().size() : 0;
    WriteRecords(std::move(spans), count, 0, response);
}

void QueryHandler::HandleMetrics(const Request& request, Response& response) {
    auto limit = ParseSizeParam(request, "limit", kDefaultLimit);
    auto offset = ParseSizeParam(request, "offset", 0);
    WriteRecords(backends_.metrics->get_page(limit, offset), limit, offset, response);
}

void QueryHandler::HandleMetricSearch(const Request& request, Response& response) {
    auto limit = ParseSizeParam(request, "limit", kDefaultLimit);
    auto offset = ParseSizeParam(request, "offset", 0);
    WriteRecords(backends_.metrics->search(request.GetParam("q"), limit, offset), limit, offset, response);
}

} // namespace server
} // namespace apptrace
