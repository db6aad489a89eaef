#ifndef APPTRACE_SERVER_QUERY_HANDLER_H_
#define APPTRACE_SERVER_QUERY_HANDLER_H_

#include <cstddef>
#include <string>

#include "apptrace/server/http_server.h"
#include "apptrace/server/request.h"
#include "apptrace/storage/storage.h"

namespace apptrace {
namespace server {

/**
 * @brief Health and read endpoints over the configured stores
 *
 *   GET /                          plain-text banner
 *   GET /health                    {"status","timestamp","storage"}
 *   GET /api/logs                  ?limit=&offset=
 *   GET /api/logs/search           ?q=&limit=&offset=
 *   GET /api/traces                ?limit=&offset=
 *   GET /api/traces/:trace_id
 *   GET /api/metrics               ?limit=&offset=
 *   GET /api/metrics/search        ?q=&limit=&offset=
 *
 * List responses are {"data":[...],"limit":n,"offset":m}.
 */
class QueryHandler {
public:
    static constexpr size_t kDefaultLimit = 100;

    explicit QueryHandler(storage::StorageBackends backends);

    void Register(HttpServer& server);

    void HandleRoot(const Request& request, Response& response);
    void HandleHealth(const Request& request, Response& response);
    void HandleLogs(const Request& request, Response& response);
    void HandleLogSearch(const Request& request, Response& response);
    void HandleTraces(const Request& request, Response& response);
    void HandleTrace(const Request& request, Response& response);
    void HandleMetrics(const Request& request, Response& response);
    void HandleMetricSearch(const Request& request, Response& response);

private:
    storage::StorageBackends backends_;
};

/**
 * @brief Parse a non-negative integer query parameter
 * @throws core::InvalidArgumentError if the value is not a number
 */
size_t ParseSizeParam(const Request& request, const std::string& name, size_t default_value);

} // namespace server
} // namespace apptrace

#endif // APPTRACE_SERVER_QUERY_HANDLER_H_
