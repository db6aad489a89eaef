#ifndef APPTRACE_STORAGE_STORAGE_H_
#define APPTRACE_STORAGE_STORAGE_H_

#include <memory>
#include <string>
#include <vector>

#include "apptrace/core/types.h"
#include "apptrace/core/config.h"
#include "apptrace/core/error.h"
#include "apptrace/core/result.h"

namespace apptrace {
namespace storage {

/**
 * @brief Storage interface for log records
 *
 * Reads are ordered by timestamp, newest first.
 */
class LogStore {
public:
    virtual ~LogStore() = default;

    /**
     * @brief Persist a batch of logs
     *
     * An empty batch is a no-op and acquires no lock or connection.
     */
    virtual core::Result<void> insert_batch(const std::vector<core::LogRecord>& records) = 0;

    /**
     * @brief Read one page, skipping @p offset records and returning at most @p limit
     */
    virtual core::Result<std::vector<core::LogRecord>> get_page(size_t limit, size_t offset) = 0;

    /**
     * @brief Case-insensitive substring search over body and serialized attributes
     */
    virtual core::Result<std::vector<core::LogRecord>> search(
        const std::string& term, size_t limit, size_t offset) = 0;
};

/**
 * @brief Storage interface for trace spans
 *
 * Pages are ordered by start_time, newest first.
 */
class SpanStore {
public:
    virtual ~SpanStore() = default;

    virtual core::Result<void> insert_batch(const std::vector<core::SpanRecord>& records) = 0;

    virtual core::Result<std::vector<core::SpanRecord>> get_page(size_t limit, size_t offset) = 0;

    /**
     * @brief All spans of one trace, ordered by start_time ascending
     */
    virtual core::Result<std::vector<core::SpanRecord>> get_by_trace_id(
        const std::string& trace_id) = 0;
};

/**
 * @brief Storage interface for metric data points
 */
class MetricStore {
public:
    virtual ~MetricStore() = default;

    virtual core::Result<void> insert_batch(const std::vector<core::MetricRecord>& records) = 0;

    virtual core::Result<std::vector<core::MetricRecord>> get_page(size_t limit, size_t offset) = 0;

    /**
     * @brief Case-insensitive substring search over name and serialized attributes
     */
    virtual core::Result<std::vector<core::MetricRecord>> search(
        const std::string& term, size_t limit, size_t offset) = 0;
};

/**
 * @brief The three stores of one backend variant
 */
struct StorageBackends {
    core::StorageType type = core::StorageType::MEMORY;
    std::shared_ptr<LogStore> logs;
    std::shared_ptr<SpanStore> spans;
    std::shared_ptr<MetricStore> metrics;
};

namespace pg {
class ConnectionFactory;
} // namespace pg

/**
 * @brief Resolve the configured backend variant into its stores
 *
 * Called once at startup.
 * @throws core::ConfigurationError if the configuration is invalid
 */
StorageBackends CreateStorageBackends(const core::StorageConfig& config);

StorageBackends CreateMemoryBackends();

/**
 * @brief PostgreSQL-backed stores (STANDARD or BULK) over the given connection factory
 */
StorageBackends CreatePostgresBackends(core::StorageType type,
                                       std::shared_ptr<pg::ConnectionFactory> factory);

} // namespace storage
} // namespace apptrace

#endif // APPTRACE_STORAGE_STORAGE_H_
