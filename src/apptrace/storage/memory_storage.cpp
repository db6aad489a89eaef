#include "apptrace/storage/memory_storage.h"
#include "apptrace/storage/attribute_json.h"

#include <algorithm>
#include <cctype>

namespace apptrace {
namespace storage {

namespace {

std::string ToLower(const std::string& text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

bool ContainsIgnoreCase(const std::string& haystack, const std::string& lowered_needle) {
    return ToLower(haystack).find(lowered_needle) != std::string::npos;
}

// Newest first, equal times keep insertion order.
template<typename Record, typename TimeOf>
std::vector<Record> NewestPage(std::vector<Record> records, TimeOf time_of,
                               size_t limit, size_t offset) {
    if (limit == 0 || offset >= records.size()) {
        return {};
    }
    std::stable_sort(records.begin(), records.end(),
                     [&time_of](const Record& a, const Record& b) {
                         return time_of(a) > time_of(b);
                     });
    auto first = records.begin() + static_cast<std::ptrdiff_t>(offset);
    auto last = first + static_cast<std::ptrdiff_t>(std::min(limit, records.size() - offset));
    return std::vector<Record>(std::make_move_iterator(first), std::make_move_iterator(last));
}

const auto kLogTime = [](const core::LogRecord& r) { return r.timestamp; };
const auto kSpanTime = [](const core::SpanRecord& r) { return r.start_time; };
const auto kMetricTime = [](const core::MetricRecord& r) { return r.timestamp; };

} // namespace

// MemoryLogStore

core::Result<void> MemoryLogStore::insert_batch(const std::vector<core::LogRecord>& records) {
    if (records.empty()) {
        return core::Result<void>();
    }
    table_.append(records);
    return core::Result<void>();
}

core::Result<std::vector<core::LogRecord>> MemoryLogStore::get_page(size_t limit, size_t offset) {
    if (limit == 0) {
        return std::vector<core::LogRecord>();
    }
    auto all = table_.select([](const core::LogRecord&) { return true; });
    return NewestPage(std::move(all), kLogTime, limit, offset);
}

core::Result<std::vector<core::LogRecord>> MemoryLogStore::search(
    const std::string& term, size_t limit, size_t offset) {
    if (limit == 0) {
        return std::vector<core::LogRecord>();
    }
    auto needle = ToLower(term);
    auto matches = table_.select([&needle](const core::LogRecord& r) {
        return ContainsIgnoreCase(r.body, needle) ||
               ContainsIgnoreCase(SerializeAttributes(r.attributes), needle);
    });
    return NewestPage(std::move(matches), kLogTime, limit, offset);
}

// MemorySpanStore

core::Result<void> MemorySpanStore::insert_batch(const std::vector<core::SpanRecord>& records) {
    if (records.empty()) {
        return core::Result<void>();
    }
    table_.append(records);
    return core::Result<void>();
}

core::Result<std::vector<core::SpanRecord>> MemorySpanStore::get_page(size_t limit, size_t offset) {
    if (limit == 0) {
        return std::vector<core::SpanRecord>();
    }
    auto all = table_.select([](const core::SpanRecord&) { return true; });
    return NewestPage(std::move(all), kSpanTime, limit, offset);
}

core::Result<std::vector<core::SpanRecord>> MemorySpanStore::get_by_trace_id(
    const std::string& trace_id) {
    auto spans = table_.select([&trace_id](const core::SpanRecord& r) {
        return r.trace_id == trace_id;
    });
    std::stable_sort(spans.begin(), spans.end(),
                     [](const core::SpanRecord& a, const core::SpanRecord& b) {
                         return a.start_time < b.start_time;
                     });
    return spans;
}

// MemoryMetricStore

core::Result<void> MemoryMetricStore::insert_batch(const std::vector<core::MetricRecord>& records) {
    if (records.empty()) {
        return core::Result<void>();
    }
    table_.append(records);
    return core::Result<void>();
}

core::Result<std::vector<core::MetricRecord>> MemoryMetricStore::get_page(size_t limit, size_t offset) {
    if (limit == 0) {
        return std::vector<core::MetricRecord>();
    }
    auto all = table_.select([](const core::MetricRecord&) { return true; });
    return NewestPage(std::move(all), kMetricTime, limit, offset);
}

core::Result<std::vector<core::MetricRecord>> MemoryMetricStore::search(
    const std::string& term, size_t limit, size_t offset) {
    if (limit == 0) {
        return std::vector<core::MetricRecord>();
    }
    auto needle = ToLower(term);
    auto matches = table_.select([&needle](const core::MetricRecord& r) {
        return ContainsIgnoreCase(r.name, needle) ||
               ContainsIgnoreCase(SerializeAttributes(r.attributes), needle);
    });
    return NewestPage(std::move(matches), kMetricTime, limit, offset);
}

} // namespace storage
} // namespace apptrace
