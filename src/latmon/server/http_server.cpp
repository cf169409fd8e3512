#include "latmon/server/http_server.h"
#include "latmon/common/logger.h"
#include <httplib.h>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <chrono>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace latmon {
namespace server {

class HttpServer::Impl {
public:
    explicit Impl(const core::ServerConfig& config)
        : config_(config), server_(std::make_unique<httplib::Server>()),
          bound_port_(-1), request_count_(0), in_flight_(0), rejected_(0) {
        server_->set_read_timeout(config.timeout_seconds);
        server_->set_write_timeout(config.timeout_seconds);

        server_->Get("/metrics", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(GetMetricsJson(), "application/json");
        });
    }

    void Start() {
        if (server_thread_.joinable()) {
            throw ServerError("Server is already running");
        }

        if (config_.port == 0) {
            bound_port_ = server_->bind_to_any_port(config_.listen_address.c_str());
        } else if (server_->bind_to_port(config_.listen_address.c_str(), config_.port)) {
            bound_port_ = config_.port;
        } else {
            bound_port_ = -1;
        }
        if (bound_port_ <= 0) {
            throw ServerError("Failed to bind " + config_.listen_address + ":" + std::to_string(config_.port));
        }

        server_thread_ = std::thread([this]() {
            if (!server_->listen_after_bind()) {
                LATMON_ERROR("HTTP server on port {} stopped listening", bound_port_);
            }
        });
        // stop() is a no-op until the accept loop runs
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!server_->is_running() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        LATMON_INFO("HTTP server listening on {}:{}", config_.listen_address, bound_port_);
    }

    void Stop() {
        if (server_thread_.joinable()) {
            server_->stop();
            server_thread_.join();
            LATMON_INFO("HTTP server stopped");
        }
    }

    int port() const { return bound_port_; }

    void RegisterHandler(const std::string& path, RequestHandler handler) {
        {
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            handlers_[path] = std::move(handler);
        }

        server_->Get(path.c_str(), [this, path](const httplib::Request& req, httplib::Response& res) {
            InFlight guard(in_flight_);
            request_count_++;
            if (guard.count > config_.max_connections) {
                rejected_++;
                res.status = 503;
                res.set_content(CreateErrorJson("Too many concurrent requests"), "application/json");
                return;
            }

            RequestHandler handler;
            {
                std::lock_guard<std::mutex> lock(handlers_mutex_);
                handler = handlers_[path];
            }

            try {
                Request request;
                request.method = req.method;
                request.path = req.path;
                for (const auto& [k, v] : req.params) {
                    request.params.insert({k, v});
                }
                for (const auto& [k, v] : req.headers) {
                    request.headers[k] = v;
                }

                Response response;
                handler(request, response);
                res.status = response.status;
                res.set_content(response.body, response.content_type.c_str());
            } catch (const std::exception& e) {
                LATMON_ERROR("Handler for {} failed: {}", path, e.what());
                res.status = 500;
                res.set_content(CreateErrorJson(e.what()), "application/json");
            }
        });
    }

    std::string GetMetricsJson() const {
        rapidjson::Document doc;
        doc.SetObject();
        auto& allocator = doc.GetAllocator();

        doc.AddMember("in_flight_requests", in_flight_.load(), allocator);
        doc.AddMember("total_requests", request_count_.load(), allocator);
        doc.AddMember("rejected_requests", rejected_.load(), allocator);

        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);

        return buffer.GetString();
    }

private:
    struct InFlight {
        explicit InFlight(std::atomic<uint64_t>& counter) : counter_(counter), count(++counter) {}
        ~InFlight() { counter_--; }
        std::atomic<uint64_t>& counter_;
        uint64_t count;
    };

    core::ServerConfig config_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    int bound_port_;
    std::unordered_map<std::string, RequestHandler> handlers_;
    mutable std::mutex handlers_mutex_;
    std::atomic<uint64_t> request_count_;
    std::atomic<uint64_t> in_flight_;
    std::atomic<uint64_t> rejected_;

    std::string CreateErrorJson(const std::string& message) const {
        rapidjson::Document doc;
        doc.SetObject();
        auto& allocator = doc.GetAllocator();

        doc.AddMember("status", "error", allocator);
        doc.AddMember("error",
                      rapidjson::Value(message.c_str(), allocator).Move(),
                      allocator);

        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);

        return buffer.GetString();
    }
};

HttpServer::HttpServer(const core::ServerConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpServer::~HttpServer() {
    Stop();
}

void HttpServer::Start() {
    if (running_) {
        throw ServerError("Server is already running");
    }
    impl_->Start();
    running_ = true;
}

void HttpServer::Stop() {
    if (running_) {
        impl_->Stop();
        running_ = false;
    }
}

bool HttpServer::IsRunning() const {
    return running_;
}

int HttpServer::port() const {
    return impl_->port();
}

void HttpServer::RegisterHandler(const std::string& path, RequestHandler handler) {
    impl_->RegisterHandler(path, std::move(handler));
}

std::string HttpServer::GetMetrics() const {
    return impl_->GetMetricsJson();
}

} // namespace server
} // namespace latmon
