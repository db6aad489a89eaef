#include "apptrace/storage/postgres/connection.h"
#include "apptrace/core/error.h"

#include <algorithm>

namespace apptrace {
namespace storage {
namespace pg {

namespace {

// Keep individual PQputCopyData calls bounded.
constexpr size_t kCopyChunkSize = 1 << 20;

std::string TrimTrailingNewline(std::string message) {
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
        message.pop_back();
    }
    return message;
}

} // namespace

// QueryResult

QueryResult::~QueryResult() {
    if (result_ != nullptr) {
        PQclear(result_);
    }
}

QueryResult& QueryResult::operator=(QueryResult&& other) noexcept {
    if (this != &other) {
        if (result_ != nullptr) {
            PQclear(result_);
        }
        result_ = other.result_;
        other.result_ = nullptr;
    }
    return *this;
}

ExecStatusType QueryResult::status() const {
    return result_ != nullptr ? PQresultStatus(result_) : PGRES_FATAL_ERROR;
}

std::string QueryResult::error_message() const {
    return result_ != nullptr ? TrimTrailingNewline(PQresultErrorMessage(result_)) : std::string();
}

int QueryResult::rows() const {
    return result_ != nullptr ? PQntuples(result_) : 0;
}

bool QueryResult::is_null(int row, int column) const {
    return PQgetisnull(result_, row, column) == 1;
}

std::string QueryResult::get(int row, int column) const {
    if (is_null(row, column)) {
        return std::string();
    }
    return std::string(PQgetvalue(result_, row, column),
                       static_cast<size_t>(PQgetlength(result_, row, column)));
}

// Connection

Connection::Connection(const std::string& conninfo) : conn_(PQconnectdb(conninfo.c_str())) {
    if (conn_ == nullptr) {
        throw core::StorageError("Failed to allocate PostgreSQL connection");
    }
    if (PQstatus(conn_) != CONNECTION_OK) {
        std::string message = "Failed to connect to PostgreSQL: " + last_error();
        PQfinish(conn_);
        conn_ = nullptr;
        throw core::StorageError(message);
    }
}

Connection::~Connection() {
    if (conn_ != nullptr) {
        PQfinish(conn_);
    }
}

std::string Connection::last_error() const {
    return TrimTrailingNewline(PQerrorMessage(conn_));
}

QueryResult Connection::check(PGresult* raw, const std::string& context) {
    QueryResult result(raw);
    if (raw == nullptr) {
        throw core::StorageError(context + " failed: " + last_error());
    }
    auto status = result.status();
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        throw core::StorageError(context + " failed: " + result.error_message());
    }
    return result;
}

QueryResult Connection::exec(const std::string& sql) {
    return check(PQexec(conn_, sql.c_str()), "Statement");
}

QueryResult Connection::exec_params(const std::string& sql, const std::vector<Param>& params) {
    // Lengths are explicit so an embedded NUL is never read as a terminator.
    std::vector<const char*> values;
    std::vector<int> lengths;
    values.reserve(params.size());
    lengths.reserve(params.size());
    for (const auto& param : params) {
        values.push_back(param ? param->data() : nullptr);
        lengths.push_back(param ? static_cast<int>(param->size()) : 0);
    }
    const std::vector<int> formats(params.size(), 0);
    return check(PQexecParams(conn_, sql.c_str(), static_cast<int>(values.size()),
                              nullptr, values.data(), lengths.data(), formats.data(), 0),
                 "Statement");
}

void Connection::copy_in(const std::string& copy_sql, const std::string& data) {
    {
        QueryResult start(PQexec(conn_, copy_sql.c_str()));
        if (start.status() != PGRES_COPY_IN) {
            auto message = start.error_message();
            throw core::StorageError("COPY failed to start: " +
                                     (message.empty() ? last_error() : message));
        }
    }

    for (size_t offset = 0; offset < data.size(); offset += kCopyChunkSize) {
        size_t length = std::min(kCopyChunkSize, data.size() - offset);
        if (PQputCopyData(conn_, data.data() + offset, static_cast<int>(length)) != 1) {
            throw core::StorageError("COPY data transfer failed: " + last_error());
        }
    }
    if (PQputCopyEnd(conn_, nullptr) != 1) {
        throw core::StorageError("COPY termination failed: " + last_error());
    }

    // The server reports row rejections here; drain every result.
    std::string failure;
    while (PGresult* raw = PQgetResult(conn_)) {
        QueryResult result(raw);
        if (result.status() != PGRES_COMMAND_OK && failure.empty()) {
            failure = result.error_message();
        }
    }
    if (!failure.empty()) {
        throw core::StorageError("COPY failed: " + failure);
    }
}

// LibpqConnectionFactory

std::unique_ptr<Connection> LibpqConnectionFactory::open() {
    return std::make_unique<Connection>(conninfo_);
}

} // namespace pg
} // namespace storage
} // namespace apptrace
