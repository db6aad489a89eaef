#ifndef APPTRACE_STORAGE_POSTGRES_WRITERS_H_
#define APPTRACE_STORAGE_POSTGRES_WRITERS_H_

#include <algorithm>
#include <exception>
#include <memory>
#include <string>
#include <vector>

#include "apptrace/storage/batch_writer.h"
#include "apptrace/storage/postgres/connection.h"
#include "apptrace/storage/postgres/encoding.h"
#include "apptrace/storage/postgres/record_tables.h"

namespace apptrace {
namespace storage {
namespace pg {

/**
 * @brief Parameterized multi-row INSERT
 *
 * One statement per batch. A batch that would exceed the bind parameter
 * cap is split over several statements inside one transaction, so the
 * batch is still applied all-or-nothing.
 */
template<typename Record>
class RowWriter : public BatchWriter<Record> {
public:
    using Table = RecordTable<Record>;

    explicit RowWriter(std::shared_ptr<ConnectionFactory> factory)
        : factory_(std::move(factory)) {}

    core::Result<void> write(const std::vector<Record>& records) override {
        if (records.empty()) {
            return core::Result<void>();
        }
        try {
            const auto& columns = Table::Columns();
            const size_t rows_per_statement = kMaxStatementParams / columns.size();
            const bool chunked = records.size() > rows_per_statement;

            auto conn = factory_->open();
            if (chunked) {
                conn->exec("BEGIN");
            }
            ParamEncoder params;
            for (size_t first = 0; first < records.size(); first += rows_per_statement) {
                size_t count = std::min(rows_per_statement, records.size() - first);
                params.clear();
                for (size_t i = first; i < first + count; i++) {
                    Table::Encode(records[i], params);
                }
                conn->exec_params(BuildInsertSql(Table::kTable, columns, count), params.params());
            }
            if (chunked) {
                conn->exec("COMMIT");
            }
            return core::Result<void>();
        } catch (const std::exception& e) {
            return core::Result<void>::error(e.what());
        }
    }

    std::string name() const override { return "insert"; }

private:
    std::shared_ptr<ConnectionFactory> factory_;
};

/**
 * @brief Binary COPY ... FROM STDIN of the whole batch
 */
template<typename Record>
class CopyWriter : public BatchWriter<Record> {
public:
    using Table = RecordTable<Record>;

    explicit CopyWriter(std::shared_ptr<ConnectionFactory> factory)
        : factory_(std::move(factory)) {}

    core::Result<void> write(const std::vector<Record>& records) override {
        if (records.empty()) {
            return core::Result<void>();
        }
        try {
            const auto& columns = Table::Columns();
            CopyEncoder encoder;
            for (const auto& record : records) {
                encoder.begin_row(columns.size());
                Table::Encode(record, encoder);
            }
            auto payload = encoder.finish();

            auto conn = factory_->open();
            conn->copy_in(BuildCopySql(Table::kTable, columns), payload);
            return core::Result<void>();
        } catch (const std::exception& e) {
            return core::Result<void>::error(e.what());
        }
    }

    std::string name() const override { return "copy"; }

private:
    std::shared_ptr<ConnectionFactory> factory_;
};

} // namespace pg
} // namespace storage
} // namespace apptrace

#endif // APPTRACE_STORAGE_POSTGRES_WRITERS_H_
