#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/server_builder.h>

#include "apptrace/common/logger.h"
#include "apptrace/core/config.h"
#include "apptrace/core/error.h"
#include "apptrace/otel/ingestion_service.h"
#include "apptrace/server/http_server.h"
#include "apptrace/server/query_handler.h"
#include "apptrace/storage/storage.h"

// Global flag for shutdown
std::atomic<bool> g_running(true);

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running.store(false);
    }
}

namespace apptrace {

class CollectorServer {
public:
    explicit CollectorServer(core::CollectorConfig config)
        : config_(std::move(config)), shutdown_(false) {}

    /**
     * @throws core::ConfigurationError if the storage configuration is invalid
     */
    bool Start() {
        backends_ = storage::CreateStorageBackends(config_.storage);

        if (config_.http_port > 0) {
            try {
                server::ServerConfig server_config;
                server_config.port = config_.http_port;
                http_server_ = std::make_unique<server::HttpServer>(server_config);

                query_handler_ = std::make_unique<server::QueryHandler>(backends_);
                query_handler_->Register(*http_server_);

                http_server_->Start();
                APPTRACE_INFO("HTTP server listening on port {}", config_.http_port);
            } catch (const std::exception& e) {
                APPTRACE_ERROR("Failed to start HTTP server: {}", e.what());
                return false;
            }
        }

        grpc::ServerBuilder builder;
        builder.AddListeningPort(config_.address, grpc::InsecureServerCredentials());
        builder.SetMaxReceiveMessageSize(static_cast<int>(config_.max_message_size));
        builder.SetMaxSendMessageSize(static_cast<int>(config_.max_message_size));

        logs_service_ = std::make_unique<otel::LogsService>(backends_.logs);
        trace_service_ = std::make_unique<otel::TraceService>(backends_.spans);
        metrics_service_ = std::make_unique<otel::MetricsService>(backends_.metrics);
        builder.RegisterService(logs_service_.get());
        builder.RegisterService(trace_service_.get());
        builder.RegisterService(metrics_service_.get());

        grpc_server_ = builder.BuildAndStart();
        if (!grpc_server_) {
            APPTRACE_ERROR("Failed to start gRPC server on {}", config_.address);
            return false;
        }

        APPTRACE_INFO("OTLP gRPC server listening on {} ({} storage)", config_.address,
                      core::StorageTypeName(backends_.type));
        return true;
    }

    void Stop() {
        if (shutdown_.exchange(true)) {
            return;
        }

        if (http_server_) {
            APPTRACE_INFO("Stopping HTTP server...");
            http_server_->Stop();
        }

        if (grpc_server_) {
            APPTRACE_INFO("Shutting down gRPC server...");
            grpc_server_->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
            grpc_server_->Wait();
            grpc_server_.reset();
        }
        APPTRACE_INFO("Collector stopped");
    }

    void Wait() {
        while (g_running.load() && !shutdown_.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        Stop();
    }

private:
    core::CollectorConfig config_;
    std::atomic<bool> shutdown_;
    storage::StorageBackends backends_;

    std::unique_ptr<server::HttpServer> http_server_;
    std::unique_ptr<server::QueryHandler> query_handler_;

    std::unique_ptr<grpc::Server> grpc_server_;
    std::unique_ptr<otel::LogsService> logs_service_;
    std::unique_ptr<otel::TraceService> trace_service_;
    std::unique_ptr<otel::MetricsService> metrics_service_;
};

} // namespace apptrace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    apptrace::common::Logger::Init();

    apptrace::core::CollectorConfig config;
    try {
        config = apptrace::core::ParseCommandLine(std::vector<std::string>(argv + 1, argv + argc));
        if (config.show_help) {
            std::cout << apptrace::core::UsageText(argv[0]);
            return 0;
        }
        config.validate();
    } catch (const apptrace::core::ConfigurationError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << "Use --help for usage information" << std::endl;
        return 1;
    }
    if (!apptrace::common::Logger::SetLevel(config.log_level)) {
        APPTRACE_WARN("Unknown log level: {}. Using default (info).", config.log_level);
    }

    try {
        apptrace::CollectorServer server(config);

        if (!server.Start()) {
            return 1;
        }

        APPTRACE_INFO("Collector running. Press Ctrl+C to stop.");
        server.Wait();
        return 0;
    } catch (const apptrace::core::ConfigurationError& e) {
        APPTRACE_CRITICAL("Configuration error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        APPTRACE_CRITICAL("Fatal error: {}", e.what());
        return 1;
    }
}
