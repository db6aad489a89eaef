#include "apptrace/server/http_server.h"
#include "apptrace/common/logger.h"
#include "apptrace/core/error.h"
#include <httplib.h>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <thread>

namespace apptrace {
namespace server {

std::string ErrorJson(const std::string& message) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& allocator = doc.GetAllocator();

    doc.AddMember("error",
                  rapidjson::Value(message.c_str(), allocator).Move(),
                  allocator);

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);

    return buffer.GetString();
}

class HttpServer::Impl {
public:
    explicit Impl(const ServerConfig& config)
        : config_(config), server_(std::make_unique<httplib::Server>()) {
        server_->set_read_timeout(config.timeout_seconds);
        server_->set_write_timeout(config.timeout_seconds);

        if (config.enable_cors) {
            server_->set_post_routing_handler([](const httplib::Request& /*req*/, httplib::Response& res) {
                res.set_header("Access-Control-Allow-Origin", "*");
            });
        }
    }

    void Start() {
        if (server_thread_.joinable()) {
            throw ServerError("Server is already running");
        }
        if (!server_->bind_to_port(config_.listen_address.c_str(), config_.port)) {
            throw ServerError("Failed to bind HTTP server to " + config_.listen_address + ":" +
                              std::to_string(config_.port));
        }
        server_thread_ = std::thread([this]() {
            if (!server_->listen_after_bind()) {
                APPTRACE_ERROR("HTTP server on port {} stopped unexpectedly", config_.port);
            }
        });
    }

    void Stop() {
        if (server_thread_.joinable()) {
            server_->stop();
            server_thread_.join();
        }
    }

    void RegisterHandler(const std::string& path, RequestHandler handler) {
        server_->Get(path, [handler](const httplib::Request& req, httplib::Response& res) {
            Request request;
            request.method = req.method;
            request.path = req.path;
            request.body = req.body;

            for (const auto& [k, v] : req.params) {
                request.params.insert({k, v});
            }
            for (const auto& [k, v] : req.path_params) {
                request.path_params[k] = v;
            }
            for (const auto& [k, v] : req.headers) {
                request.headers[k] = v;
            }

            Response response;
            try {
                handler(request, response);
            } catch (const core::InvalidArgumentError& e) {
                response.status = 400;
                response.body = ErrorJson(e.what());
                response.content_type = "application/json";
            } catch (const std::exception& e) {
                APPTRACE_ERROR("Handler for {} failed: {}", req.path, e.what());
                response.status = 500;
                response.body = ErrorJson(e.what());
                response.content_type = "application/json";
            }
            res.status = response.status;
            res.set_content(response.body, response.content_type.c_str());
        });
    }

private:
    ServerConfig config_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

HttpServer::HttpServer(const ServerConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpServer::~HttpServer() {
    Stop();
}

void HttpServer::Start() {
    impl_->Start();
}

void HttpServer::Stop() {
    impl_->Stop();
}

void HttpServer::RegisterHandler(const std::string& path, RequestHandler handler) {
    impl_->RegisterHandler(path, std::move(handler));
}

} // namespace server
} // namespace apptrace
