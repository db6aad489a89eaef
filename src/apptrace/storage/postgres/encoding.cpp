#include "apptrace/storage/postgres/encoding.h"
#include "apptrace/core/error.h"

#include <cmath>
#include <cstring>
#include <limits>
#include <sstream>

namespace apptrace {
namespace storage {
namespace pg {

namespace {

const char kCopySignature[] = "PGCOPY\n\377\r\n\0";
constexpr size_t kCopySignatureLength = 11;
constexpr uint8_t kJsonbVersion = 1;

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::array<uint8_t, 16> ParseUuid(const std::string& text) {
    if (text.size() != 36 || text[8] != '-' || text[13] != '-' ||
        text[18] != '-' || text[23] != '-') {
        throw core::InvalidArgumentError("Invalid UUID: " + text);
    }
    std::array<uint8_t, 16> bytes{};
    size_t out = 0;
    for (size_t i = 0; i < text.size();) {
        if (text[i] == '-') {
            i++;
            continue;
        }
        int high = HexValue(text[i]);
        int low = HexValue(text[i + 1]);
        if (high < 0 || low < 0) {
            throw core::InvalidArgumentError("Invalid UUID: " + text);
        }
        bytes[out++] = static_cast<uint8_t>((high << 4) | low);
        i += 2;
    }
    return bytes;
}

std::string FormatFloat8(double value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "Infinity" : "-Infinity";
    }
    std::ostringstream oss;
    oss.precision(std::numeric_limits<double>::max_digits10);
    oss << value;
    return oss.str();
}

// ParamEncoder

void ParamEncoder::add_uuid(const std::string& uuid) {
    params_.emplace_back(uuid);
}

void ParamEncoder::add_timestamp(core::Timestamp micros) {
    params_.emplace_back(std::to_string(micros));
}

void ParamEncoder::add_text(const std::string& text) {
    params_.emplace_back(text);
}

void ParamEncoder::add_optional_text(const std::string& text) {
    if (text.empty()) {
        params_.emplace_back(std::nullopt);
    } else {
        params_.emplace_back(text);
    }
}

void ParamEncoder::add_float8(double value) {
    params_.emplace_back(FormatFloat8(value));
}

void ParamEncoder::add_jsonb(const std::string& json) {
    params_.emplace_back(json);
}

// CopyEncoder

CopyEncoder::CopyEncoder() {
    buffer_.append(kCopySignature, kCopySignatureLength);
    put_int32(0);  // flags
    put_int32(0);  // header extension length
}

void CopyEncoder::begin_row(size_t field_count) {
    put_int16(static_cast<int16_t>(field_count));
    rows_++;
}

void CopyEncoder::add_uuid(const std::string& uuid) {
    auto bytes = ParseUuid(uuid);
    put_field(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

void CopyEncoder::add_timestamp(core::Timestamp micros) {
    put_int32(8);
    put_int64(micros - kPostgresEpochOffsetMicros);
}

void CopyEncoder::add_text(const std::string& text) {
    put_field(text.data(), text.size());
}

void CopyEncoder::add_optional_text(const std::string& text) {
    if (text.empty()) {
        put_null();
    } else {
        put_field(text.data(), text.size());
    }
}

void CopyEncoder::add_float8(double value) {
    uint64_t bits;
    static_assert(sizeof(bits) == sizeof(value), "float8 must be 64 bits");
    std::memcpy(&bits, &value, sizeof(bits));
    put_int32(8);
    put_int64(static_cast<int64_t>(bits));
}

void CopyEncoder::add_jsonb(const std::string& json) {
    put_int32(static_cast<int32_t>(json.size() + 1));
    buffer_.push_back(static_cast<char>(kJsonbVersion));
    buffer_.append(json);
}

std::string CopyEncoder::finish() {
    put_int16(-1);
    return std::move(buffer_);
}

void CopyEncoder::put_int16(int16_t value) {
    auto bits = static_cast<uint16_t>(value);
    buffer_.push_back(static_cast<char>((bits >> 8) & 0xFF));
    buffer_.push_back(static_cast<char>(bits & 0xFF));
}

void CopyEncoder::put_int32(int32_t value) {
    auto bits = static_cast<uint32_t>(value);
    for (int shift = 24; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<char>((bits >> shift) & 0xFF));
    }
}

void CopyEncoder::put_int64(int64_t value) {
    auto bits = static_cast<uint64_t>(value);
    for (int shift = 56; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<char>((bits >> shift) & 0xFF));
    }
}

void CopyEncoder::put_field(const char* data, size_t length) {
    if (length > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        throw core::InvalidArgumentError("COPY field exceeds 2GB");
    }
    put_int32(static_cast<int32_t>(length));
    buffer_.append(data, length);
}

void CopyEncoder::put_null() {
    put_int32(-1);
}

} // namespace pg
} // namespace storage
} // namespace apptrace
