#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace apptrace {
namespace core {

/**
 * @brief Storage backend variants
 */
enum class StorageType {
    MEMORY,     // In-process vectors, development and testing only
    STANDARD,   // PostgreSQL parameterized multi-row INSERT
    BULK        // PostgreSQL binary COPY with INSERT fallback
};

/**
 * @brief Map a configuration value to a backend variant
 *
 * Recognized (case-insensitive): memory, inmemory, standard, bulk, highperformance.
 * @throws ConfigurationError for any other value
 */
StorageType ParseStorageType(const std::string& value);

std::string StorageTypeName(StorageType type);

/**
 * @brief Storage selection, resolved once at startup
 */
struct StorageConfig {
    StorageType type;
    std::string connection_string;  // libpq conninfo, required unless type is MEMORY

    StorageConfig() : type(StorageType::STANDARD) {}

    static StorageConfig Memory() {
        StorageConfig config;
        config.type = StorageType::MEMORY;
        return config;
    }

    /**
     * @throws ConfigurationError if a database backend has no connection string
     */
    void validate() const;
};

/**
 * @brief Process configuration for the collector
 */
struct CollectorConfig {
    std::string address;            // gRPC listen address
    uint16_t http_port;             // Health and query API port, 0 disables it
    size_t max_message_size;        // Maximum gRPC message size in bytes
    std::string log_level;
    StorageConfig storage;
    bool show_help;

    CollectorConfig()
        : address("0.0.0.0:4317"), http_port(8080),
          max_message_size(4 * 1024 * 1024), log_level("info"),
          show_help(false) {}

    static CollectorConfig Default() { return CollectorConfig(); }

    /**
     * @throws ConfigurationError on any invalid setting
     */
    void validate() const;
};

/**
 * @brief Build the collector configuration from the environment and argv
 *
 * APPTRACE_STORAGE_TYPE and APPTRACE_CONNECTION_STRING are read first;
 * command-line flags override them.
 * @throws ConfigurationError on unknown flags or malformed values
 */
CollectorConfig ParseCommandLine(const std::vector<std::string>& args);

std::string UsageText(const std::string& program);

} // namespace core
} // namespace apptrace
