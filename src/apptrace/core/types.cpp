#include "apptrace/core/types.h"
#include <array>
#include <cstdio>
#include <iterator>
#include <random>
#include <sstream>
#include <type_traits>

namespace apptrace {
namespace core {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

template <typename It>
std::string HexEncodeRange(It begin, It end) {
    std::string out;
    out.reserve(static_cast<size_t>(std::distance(begin, end)) * 2);
    for (auto it = begin; it != end; ++it) {
        auto byte = static_cast<uint8_t>(*it);
        out.push_back(kHexDigits[byte >> 4]);
        out.push_back(kHexDigits[byte & 0x0F]);
    }
    return out;
}

std::mt19937_64& RandomEngine() {
    thread_local std::mt19937_64 engine = [] {
        std::random_device device;
        std::seed_seq seed{device(), device(), device(), device()};
        return std::mt19937_64(seed);
    }();
    return engine;
}

} // namespace

bool LogRecord::operator==(const LogRecord& other) const {
    return id == other.id && timestamp == other.timestamp &&
           trace_id == other.trace_id && span_id == other.span_id &&
           severity == other.severity && body == other.body &&
           attributes == other.attributes;
}

bool SpanRecord::operator==(const SpanRecord& other) const {
    return id == other.id && trace_id == other.trace_id &&
           span_id == other.span_id && parent_span_id == other.parent_span_id &&
           name == other.name && start_time == other.start_time &&
           end_time == other.end_time && attributes == other.attributes &&
           status == other.status;
}

bool MetricRecord::operator==(const MetricRecord& other) const {
    return id == other.id && name == other.name &&
           timestamp == other.timestamp && value == other.value &&
           attributes == other.attributes;
}

std::string GenerateRecordId() {
    auto& engine = RandomEngine();
    uint64_t high = engine();
    uint64_t low = engine();

    // Version 4, RFC 4122 variant
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::array<char, 37> buffer{};
    std::snprintf(buffer.data(), buffer.size(), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(high >> 32),
                  static_cast<unsigned>((high >> 16) & 0xFFFF),
                  static_cast<unsigned>(high & 0xFFFF),
                  static_cast<unsigned>(low >> 48),
                  static_cast<unsigned long long>(low & 0xFFFFFFFFFFFFULL));
    return std::string(buffer.data(), 36);
}

Timestamp NanosToTimestamp(uint64_t nanos) {
    return static_cast<Timestamp>(nanos / 1000);
}

std::string HexEncode(const std::string& bytes) {
    return HexEncodeRange(bytes.begin(), bytes.end());
}

std::string HexEncode(const Bytes& bytes) {
    return HexEncodeRange(bytes.begin(), bytes.end());
}

std::string AttributeToString(const AttributeValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<V, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<V, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<V, double>) {
            std::ostringstream oss;
            oss.precision(15);
            oss << v;
            return oss.str();
        } else {
            return HexEncode(v);
        }
    }, value);
}

std::string ServiceNameOf(const Attributes& attributes) {
    auto it = attributes.find(kServiceNameKey);
    if (it == attributes.end()) {
        return kUnknownServiceName;
    }
    return AttributeToString(it->second);
}

} // namespace core
} // namespace apptrace
