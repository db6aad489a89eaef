#ifndef APPTRACE_STORAGE_MEMORY_STORAGE_H_
#define APPTRACE_STORAGE_MEMORY_STORAGE_H_

#include <mutex>
#include <vector>

#include "apptrace/storage/storage.h"

namespace apptrace {
namespace storage {

/**
 * @brief Append-only record vector guarded by a single mutex
 *
 * The lock covers the append and the copy-out scan only; sorting and
 * slicing happen on the copy.
 */
template<typename Record>
class MemoryTable {
public:
    void append(const std::vector<Record>& records) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.insert(records_.end(), records.begin(), records.end());
    }

    template<typename Predicate>
    std::vector<Record> select(Predicate predicate) const {
        std::vector<Record> matches;
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& record : records_) {
            if (predicate(record)) {
                matches.push_back(record);
            }
        }
        return matches;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<Record> records_;
};

class MemoryLogStore : public LogStore {
public:
    core::Result<void> insert_batch(const std::vector<core::LogRecord>& records) override;
    core::Result<std::vector<core::LogRecord>> get_page(size_t limit, size_t offset) override;
    core::Result<std::vector<core::LogRecord>> search(
        const std::string& term, size_t limit, size_t offset) override;

    size_t size() const { return table_.size(); }

private:
    MemoryTable<core::LogRecord> table_;
};

class MemorySpanStore : public SpanStore {
public:
    core::Result<void> insert_batch(const std::vector<core::SpanRecord>& records) override;
    core::Result<std::vector<core::SpanRecord>> get_page(size_t limit, size_t offset) override;
    core::Result<std::vector<core::SpanRecord>> get_by_trace_id(const std::string& trace_id) override;

    size_t size() const { return table_.size(); }

private:
    MemoryTable<core::SpanRecord> table_;
};

class MemoryMetricStore : public MetricStore {
public:
    core::Result<void> insert_batch(const std::vector<core::MetricRecord>& records) override;
    core::Result<std::vector<core::MetricRecord>> get_page(size_t limit, size_t offset) override;
    core::Result<std::vector<core::MetricRecord>> search(
        const std::string& term, size_t limit, size_t offset) override;

    size_t size() const { return table_.size(); }

private:
    MemoryTable<core::MetricRecord> table_;
};

} // namespace storage
} // namespace apptrace

#endif // APPTRACE_STORAGE_MEMORY_STORAGE_H_
