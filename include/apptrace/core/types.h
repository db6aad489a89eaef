#ifndef APPTRACE_CORE_TYPES_H_
#define APPTRACE_CORE_TYPES_H_

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <variant>

namespace apptrace {
namespace core {

/**
 * @brief Represents a timestamp in microseconds since Unix epoch
 */
using Timestamp = int64_t;

/**
 * @brief Represents a duration in microseconds
 */
using Duration = int64_t;

using Bytes = std::vector<uint8_t>;

/**
 * @brief A single attribute value: string, bool, int64, float64 or byte-sequence
 */
using AttributeValue = std::variant<std::string, bool, int64_t, double, Bytes>;

/**
 * @brief Attribute set of a record; key order carries no meaning
 */
using Attributes = std::map<std::string, AttributeValue>;

constexpr const char* kServiceNameKey = "service.name";
constexpr const char* kUnknownServiceName = "unknown";
constexpr const char* kDefaultSpanStatus = "OK";

/**
 * @brief A decoded log entry
 */
struct LogRecord {
    std::string id;
    Timestamp timestamp = 0;
    std::string trace_id;       // Lowercase hex, empty when absent
    std::string span_id;        // Lowercase hex, empty when absent
    std::string severity;
    std::string body;
    Attributes attributes;

    bool operator==(const LogRecord& other) const;
    bool operator!=(const LogRecord& other) const { return !(*this == other); }
};

/**
 * @brief A decoded trace span
 */
struct SpanRecord {
    std::string id;
    std::string trace_id;
    std::string span_id;
    std::string parent_span_id; // Empty for root spans
    std::string name;
    Timestamp start_time = 0;
    Timestamp end_time = 0;     // Always >= start_time
    Attributes attributes;
    std::string status = kDefaultSpanStatus;

    Duration duration() const { return end_time - start_time; }

    bool operator==(const SpanRecord& other) const;
    bool operator!=(const SpanRecord& other) const { return !(*this == other); }
};

/**
 * @brief A single decoded metric data point
 */
struct MetricRecord {
    std::string id;
    std::string name;
    Timestamp timestamp = 0;
    double value = 0.0;
    Attributes attributes;

    bool operator==(const MetricRecord& other) const;
    bool operator!=(const MetricRecord& other) const { return !(*this == other); }
};

/**
 * @brief Generate a new random (version 4) UUID in canonical text form
 */
std::string GenerateRecordId();

/**
 * @brief Convert OTLP nanoseconds since epoch to a Timestamp
 *
 * Sub-microsecond precision is truncated.
 */
Timestamp NanosToTimestamp(uint64_t nanos);

/**
 * @brief Lowercase hex rendering of raw bytes
 */
std::string HexEncode(const std::string& bytes);
std::string HexEncode(const Bytes& bytes);

/**
 * @brief Render any attribute value as text (bytes become hex)
 */
std::string AttributeToString(const AttributeValue& value);

/**
 * @brief Text of the service.name attribute, or "unknown" if absent
 */
std::string ServiceNameOf(const Attributes& attributes);

} // namespace core
} // namespace apptrace

#endif // APPTRACE_CORE_TYPES_H_
