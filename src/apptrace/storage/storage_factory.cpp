#include "apptrace/storage/storage.h"
#include "apptrace/common/logger.h"
#include "apptrace/storage/memory_storage.h"
#include "apptrace/storage/postgres/postgres_storage.h"
#include "apptrace/storage/postgres/writers.h"

namespace apptrace {
namespace storage {

namespace {

template<typename Record>
std::shared_ptr<BatchWriter<Record>> MakeWriter(core::StorageType type,
                                                const std::shared_ptr<pg::ConnectionFactory>& factory) {
    auto row_writer = std::make_shared<pg::RowWriter<Record>>(factory);
    if (type == core::StorageType::BULK) {
        return std::make_shared<FallbackWriter<Record>>(
            std::make_shared<pg::CopyWriter<Record>>(factory), row_writer);
    }
    return row_writer;
}

} // namespace

StorageBackends CreateMemoryBackends() {
    StorageBackends backends;
    backends.type = core::StorageType::MEMORY;
    backends.logs = std::make_shared<MemoryLogStore>();
    backends.spans = std::make_shared<MemorySpanStore>();
    backends.metrics = std::make_shared<MemoryMetricStore>();
    return backends;
}

StorageBackends CreatePostgresBackends(core::StorageType type,
                                       std::shared_ptr<pg::ConnectionFactory> factory) {
    if (type == core::StorageType::MEMORY) {
        throw core::ConfigurationError("Memory storage has no PostgreSQL backend");
    }
    if (!factory) {
        throw core::ConfigurationError("PostgreSQL storage requires a connection factory");
    }
    StorageBackends backends;
    backends.type = type;
    backends.logs = std::make_shared<pg::PostgresLogStore>(
        factory, MakeWriter<core::LogRecord>(type, factory));
    backends.spans = std::make_shared<pg::PostgresSpanStore>(
        factory, MakeWriter<core::SpanRecord>(type, factory));
    backends.metrics = std::make_shared<pg::PostgresMetricStore>(
        factory, MakeWriter<core::MetricRecord>(type, factory));
    return backends;
}

StorageBackends CreateStorageBackends(const core::StorageConfig& config) {
    config.validate();
    APPTRACE_INFO("Using {} storage backend", core::StorageTypeName(config.type));
    if (config.type == core::StorageType::MEMORY) {
        return CreateMemoryBackends();
    }
    return CreatePostgresBackends(
        config.type, std::make_shared<pg::LibpqConnectionFactory>(config.connection_string));
}

} // namespace storage
} // namespace apptrace
