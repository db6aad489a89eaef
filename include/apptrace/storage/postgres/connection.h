#ifndef APPTRACE_STORAGE_POSTGRES_CONNECTION_H_
#define APPTRACE_STORAGE_POSTGRES_CONNECTION_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <libpq-fe.h>

namespace apptrace {
namespace storage {
namespace pg {

/**
 * @brief A text-format statement parameter; nullopt binds SQL NULL
 */
using Param = std::optional<std::string>;

/**
 * @brief Owns one PGresult
 */
class QueryResult {
public:
    explicit QueryResult(PGresult* result) : result_(result) {}
    ~QueryResult();

    QueryResult(QueryResult&& other) noexcept : result_(other.result_) { other.result_ = nullptr; }
    QueryResult& operator=(QueryResult&& other) noexcept;

    QueryResult(const QueryResult&) = delete;
    QueryResult& operator=(const QueryResult&) = delete;

    ExecStatusType status() const;
    std::string error_message() const;

    int rows() const;
    bool is_null(int row, int column) const;

    /**
     * @brief Text value of a cell; empty for NULL
     */
    std::string get(int row, int column) const;

private:
    PGresult* result_;
};

/**
 * @brief One libpq connection, closed on destruction
 *
 * Every method reports failures by throwing core::StorageError carrying
 * the server message.
 */
class Connection {
public:
    explicit Connection(const std::string& conninfo);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * @brief Run a statement without parameters (BEGIN, COMMIT, DDL)
     */
    QueryResult exec(const std::string& sql);

    /**
     * @brief Run a parameterized statement with text-format parameters
     *
     * Each parameter is sent with its byte length, so a value is never
     * truncated at an embedded NUL.
     */
    QueryResult exec_params(const std::string& sql, const std::vector<Param>& params);

    /**
     * @brief Stream a complete COPY ... FROM STDIN payload
     *
     * @param copy_sql The COPY statement
     * @param data The full payload in the format the statement names
     */
    void copy_in(const std::string& copy_sql, const std::string& data);

private:
    QueryResult check(PGresult* result, const std::string& context);
    std::string last_error() const;

    PGconn* conn_;
};

/**
 * @brief Source of connections for the database-backed stores
 */
class ConnectionFactory {
public:
    virtual ~ConnectionFactory() = default;

    /**
     * @brief Open a new connection
     * @throws core::StorageError if the server is unreachable
     */
    virtual std::unique_ptr<Connection> open() = 0;
};

class LibpqConnectionFactory : public ConnectionFactory {
public:
    explicit LibpqConnectionFactory(std::string conninfo) : conninfo_(std::move(conninfo)) {}

    std::unique_ptr<Connection> open() override;

private:
    std::string conninfo_;
};

} // namespace pg
} // namespace storage
} // namespace apptrace

#endif // APPTRACE_STORAGE_POSTGRES_CONNECTION_H_
