// === Request Router ==========================================================
//
// Maps an HTTP request onto one of the two read-only endpoints. Routing is a
// pure function of the request and the injected generator, so it is exercised
// directly in tests without opening sockets.

#pragma once

#include <memory>
#include <string_view>

#include <boost/beast/http.hpp>
#include <spdlog/logger.h>

#include "uav_mock/configuration.hpp"
#include "uav_mock/telemetry_generator.hpp"

namespace uav_mock {

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

inline constexpr std::string_view k_health_path{"/health"};
inline constexpr std::string_view k_state_path{"/api/v1/state"};

/** @brief Dispatches requests to the health and state handlers. */
class RequestRouter final {
  public:
    RequestRouter(std::shared_ptr<const TelemetryGenerator> generator, AccessLogPolicy access_log);

    /**
     * @brief Build the response for @p request.
     *
     * `GET /health` and `GET /api/v1/state` answer 200 with a JSON body; every
     * other method or target answers 404 with an empty body and no
     * content type. The target is compared verbatim, query string included.
     */
    [[nodiscard]] HttpResponse route(const HttpRequest& request) const;

  private:
    [[nodiscard]] HttpResponse make_json_response(const HttpRequest& request, std::string body) const;
    [[nodiscard]] HttpResponse make_not_found(const HttpRequest& request) const;

    std::shared_ptr<const TelemetryGenerator> generator_;
    AccessLogPolicy access_log_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace uav_mock
