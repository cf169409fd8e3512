#ifndef LATMON_SERVER_HTTP_SERVER_H_
#define LATMON_SERVER_HTTP_SERVER_H_

#include <atomic>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include "latmon/core/config.h"
#include "latmon/server/request.h"

namespace latmon {
namespace server {

/**
 * @brief Handler function type for HTTP endpoints
 */
using RequestHandler = std::function<void(const Request& request, Response& response)>;

/**
 * @brief Read-only HTTP surface over cpp-httplib
 *
 * Only GET routes are served. A handler that throws answers 500 with a JSON
 * error body.
 */
class HttpServer {
public:
    explicit HttpServer(const core::ServerConfig& config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind and start serving on a background thread
     *
     * Port 0 binds an ephemeral port, see port().
     * @throws ServerError if the server is running or cannot bind
     */
    void Start();

    void Stop();

    bool IsRunning() const;

    /** @brief Bound port, valid after Start() */
    int port() const;

    /**
     * @brief Register a GET handler for an exact path
     */
    void RegisterHandler(const std::string& path, RequestHandler handler);

    /**
     * @brief Request and connection counters as JSON
     */
    std::string GetMetrics() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
    std::atomic<bool> running_{false};
};

class ServerError : public std::runtime_error {
public:
    explicit ServerError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace server
} // namespace latmon

#endif // LATMON_SERVER_HTTP_SERVER_H_
