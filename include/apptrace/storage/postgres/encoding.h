#ifndef APPTRACE_STORAGE_POSTGRES_ENCODING_H_
#define APPTRACE_STORAGE_POSTGRES_ENCODING_H_

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "apptrace/core/types.h"
#include "apptrace/storage/postgres/connection.h"

namespace apptrace {
namespace storage {
namespace pg {

/**
 * @brief Column value kinds used by the persisted tables
 */
enum class ColumnKind {
    UUID,
    TIMESTAMP,      // timestamptz bound from epoch microseconds
    TEXT,
    OPTIONAL_TEXT,  // Empty string is stored as NULL
    FLOAT8,
    JSONB
};

struct Column {
    const char* name;
    ColumnKind kind;
};

/**
 * @brief Receives the fields of one row in column order
 */
class FieldSink {
public:
    virtual ~FieldSink() = default;

    virtual void add_uuid(const std::string& uuid) = 0;
    virtual void add_timestamp(core::Timestamp micros) = 0;
    virtual void add_text(const std::string& text) = 0;
    virtual void add_optional_text(const std::string& text) = 0;
    virtual void add_float8(double value) = 0;
    virtual void add_jsonb(const std::string& json) = 0;
};

/**
 * @brief Collects text-format statement parameters for PQexecParams
 */
class ParamEncoder : public FieldSink {
public:
    void add_uuid(const std::string& uuid) override;
    void add_timestamp(core::Timestamp micros) override;
    void add_text(const std::string& text) override;
    void add_optional_text(const std::string& text) override;
    void add_float8(double value) override;
    void add_jsonb(const std::string& json) override;

    const std::vector<Param>& params() const { return params_; }
    void clear() { params_.clear(); }

private:
    std::vector<Param> params_;
};

/**
 * @brief Builds a PostgreSQL binary COPY payload
 *
 * Layout: signature, flags and extension length, then per row a 16-bit
 * field count followed by length-prefixed fields (length -1 for NULL),
 * then a 16-bit -1 trailer. All integers are network byte order.
 */
class CopyEncoder : public FieldSink {
public:
    CopyEncoder();

    void begin_row(size_t field_count);

    void add_uuid(const std::string& uuid) override;
    void add_timestamp(core::Timestamp micros) override;
    void add_text(const std::string& text) override;
    void add_optional_text(const std::string& text) override;
    void add_float8(double value) override;
    void add_jsonb(const std::string& json) override;

    /**
     * @brief Append the trailer and return the payload
     */
    std::string finish();

    size_t row_count() const { return rows_; }

private:
    void put_int16(int16_t value);
    void put_int32(int32_t value);
    void put_int64(int64_t value);
    void put_field(const char* data, size_t length);
    void put_null();

    std::string buffer_;
    size_t rows_ = 0;
};

/**
 * @brief Difference between the Unix and PostgreSQL (2000-01-01) epochs
 */
constexpr int64_t kPostgresEpochOffsetMicros = 946684800000000LL;

/**
 * @brief Parse a canonical 36-character UUID into its 16 bytes
 * @throws core::InvalidArgumentError on malformed input
 */
std::array<uint8_t, 16> ParseUuid(const std::string& text);

/**
 * @brief Text rendering of a float8 that PostgreSQL parses back exactly
 */
std::string FormatFloat8(double value);

} // namespace pg
} // namespace storage
} // namespace apptrace

#endif // APPTRACE_STORAGE_POSTGRES_ENCODING_H_
