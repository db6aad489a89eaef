#include "apptrace/core/config.h"
#include "apptrace/core/error.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace apptrace {
namespace core {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

uint64_t ParseUnsigned(const std::string& flag, const std::string& value, uint64_t max) {
    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](unsigned char c) { return std::isdigit(c); })) {
        throw ConfigurationError("Invalid value for " + flag + ": " + value);
    }
    try {
        auto parsed = std::stoull(value);
        if (parsed > max) {
            throw ConfigurationError("Value for " + flag + " out of range: " + value);
        }
        return parsed;
    } catch (const std::out_of_range&) {
        throw ConfigurationError("Value for " + flag + " out of range: " + value);
    }
}

const char* GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? value : nullptr;
}

} // namespace

StorageType ParseStorageType(const std::string& value) {
    auto normalized = ToLower(value);
    if (normalized == "memory" || normalized == "inmemory") {
        return StorageType::MEMORY;
    }
    if (normalized == "standard") {
        return StorageType::STANDARD;
    }
    if (normalized == "bulk" || normalized == "highperformance") {
        return StorageType::BULK;
    }
    throw ConfigurationError("Unknown storage type: " + value);
}

std::string StorageTypeName(StorageType type) {
    switch (type) {
        case StorageType::MEMORY:
            return "memory";
        case StorageType::STANDARD:
            return "standard";
        case StorageType::BULK:
            return "bulk";
    }
    return "unknown";
}

void StorageConfig::validate() const {
    if (type != StorageType::MEMORY && connection_string.empty()) {
        throw ConfigurationError("A PostgreSQL connection string is required for storage type '" +
                                 StorageTypeName(type) + "'");
    }
}

void CollectorConfig::validate() const {
    if (address.empty()) {
        throw ConfigurationError("gRPC listen address must not be empty");
    }
    if (max_message_size == 0) {
        throw ConfigurationError("Maximum message size must be positive");
    }
    static const char* kLevels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    if (std::find(std::begin(kLevels), std::end(kLevels), log_level) == std::end(kLevels)) {
        throw ConfigurationError("Unknown log level: " + log_level);
    }
    storage.validate();
}

CollectorConfig ParseCommandLine(const std::vector<std::string>& args) {
    CollectorConfig config = CollectorConfig::Default();

    if (const char* type = GetEnv("APPTRACE_STORAGE_TYPE")) {
        config.storage.type = ParseStorageType(type);
    }
    if (const char* conninfo = GetEnv("APPTRACE_CONNECTION_STRING")) {
        config.storage.connection_string = conninfo;
    }

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        auto next_value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw ConfigurationError("Missing value for " + arg);
            }
            return args[++i];
        };

        if (arg == "--address") {
            config.address = next_value();
        } else if (arg == "--http-port") {
            config.http_port = static_cast<uint16_t>(ParseUnsigned(arg, next_value(), 65535));
        } else if (arg == "--storage-type") {
            config.storage.type = ParseStorageType(next_value());
        } else if (arg == "--connection-string") {
            config.storage.connection_string = next_value();
        } else if (arg == "--max-message-size") {
            config.max_message_size = static_cast<size_t>(
                ParseUnsigned(arg, next_value(), 1024ULL * 1024 * 1024));
        } else if (arg == "--log-level") {
            config.log_level = next_value();
        } else if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        } else {
            throw ConfigurationError("Unknown option: " + arg);
        }
    }
    return config;
}

std::string UsageText(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [OPTIONS]\n"
        << "Options:\n"
        << "  --address ADDRESS          gRPC OTLP address (default: 0.0.0.0:4317)\n"
        << "  --http-port PORT           Health/query HTTP port (default: 8080, 0 to disable)\n"
        << "  --storage-type TYPE        memory | standard | bulk | highperformance (default: standard)\n"
        << "  --connection-string STR    PostgreSQL conninfo (required unless memory)\n"
        << "  --max-message-size BYTES   Maximum gRPC message size (default: 4194304)\n"
        << "  --log-level LEVEL          trace, debug, info, warn, error, critical, off\n"
        << "  --help, -h                 Show this help message\n"
        << "Environment:\n"
        << "  APPTRACE_STORAGE_TYPE, APPTRACE_CONNECTION_STRING\n";
    return oss.str();
}

} // namespace core
} // namespace apptrace
