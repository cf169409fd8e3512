#ifndef LATMON_SERVER_API_HANDLERS_H_
#define LATMON_SERVER_API_HANDLERS_H_

#include <memory>

#include "latmon/query/query_service.h"
#include "latmon/server/http_server.h"
#include "latmon/server/request.h"

namespace latmon {
namespace server {

/**
 * @brief Route handlers of the read-only telemetry API
 *
 * QUERY_FAILURE results answer 400, any other failure 500; both with a JSON
 * error body.
 *
 * Routes:
 *   /health
 *   /api/events?limit&component
 *   /api/metrics/raw?limit
 *   /api/metrics/summary?component&window_seconds (or start&end in microseconds)
 *   /api/system/resources
 *   /api/monitoring/status
 *   /api/export?start&end&component
 *   /api/telemetry   status, last 100 events, last-hour summary and resources in one body
 */
class ApiHandlers {
public:
    explicit ApiHandlers(std::shared_ptr<const query::QueryService> queries);

    void Register(HttpServer& server) const;

    void HandleHealth(const Request& request, Response& response) const;
    void HandleEvents(const Request& request, Response& response) const;
    void HandleRawMetrics(const Request& request, Response& response) const;
    void HandleSummary(const Request& request, Response& response) const;
    void HandleSystemResources(const Request& request, Response& response) const;
    void HandleStatus(const Request& request, Response& response) const;
    void HandleExport(const Request& request, Response& response) const;
    void HandleTelemetry(const Request& request, Response& response) const;

private:
    std::shared_ptr<const query::QueryService> queries_;
};

} // namespace server
} // namespace latmon

#endif // LATMON_SERVER_API_HANDLERS_H_
