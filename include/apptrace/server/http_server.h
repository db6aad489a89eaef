#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include "apptrace/server/request.h"

namespace apptrace {
namespace server {

/**
 * @brief Configuration for the health and query HTTP server
 */
struct ServerConfig {
    std::string listen_address = "0.0.0.0";  // Listen address
    uint16_t port = 8080;                    // Listen port
    int timeout_seconds = 30;                // Read/write timeout
    bool enable_cors = true;                 // Allow any origin, for browser UIs
};

/**
 * @brief Handler function type for HTTP endpoints
 *
 * Handlers fill the response; an exception becomes a JSON error with
 * status 400 for core::InvalidArgumentError and 500 otherwise.
 */
using RequestHandler = std::function<void(const Request& request, Response& response)>;

/**
 * @brief Minimal HTTP server running on its own thread
 */
class HttpServer {
public:
    explicit HttpServer(const ServerConfig& config);
    ~HttpServer();

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind the listen socket and start serving
     * @throws ServerError if the port cannot be bound
     */
    void Start();

    void Stop();

    /**
     * @brief Register a GET handler
     * @param path The endpoint path; ":name" segments become path params
     */
    void RegisterHandler(const std::string& path, RequestHandler handler);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

class ServerError : public std::runtime_error {
public:
    explicit ServerError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Serialize {"error": message}
 */
std::string ErrorJson(const std::string& message);

} // namespace server
} // namespace apptrace
