#include "uav_mock/request_router.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "uav_mock/logging.hpp"
#include "uav_mock/telemetry_json.hpp"
#include "uav_mock/version.hpp"

namespace uav_mock {

namespace {

std::string server_banner() {
    return fmt::format("uav-mock/{}", k_version);
}

}  // namespace

RequestRouter::RequestRouter(std::shared_ptr<const TelemetryGenerator> generator, AccessLogPolicy access_log)
    : generator_(std::move(generator)),
      access_log_(access_log),
      logger_(get_logger()) {
    if (generator_ == nullptr) {
        throw std::invalid_argument("RequestRouter requires a telemetry generator");
    }
}

HttpResponse RequestRouter::route(const HttpRequest& request) const {
    const auto target = request.target();
    const std::string_view path{target.data(), target.size()};

    HttpResponse response;
    if (request.method() == http::verb::get && path == k_health_path) {
        const Json document = make_health_document(generator_->state().baseline.identity.uav_id);
        response = make_json_response(request, to_body(document));
    } else if (request.method() == http::verb::get && path == k_state_path) {
        const Json document = make_state_document(generator_->current_snapshot());
        response = make_json_response(request, to_body(document));
    } else {
        response = make_not_found(request);
    }

    if (access_log_ == AccessLogPolicy::Enabled) {
        const auto method = request.method_string();
        logger_->info("{} {} -> {}",
                      std::string_view{method.data(), method.size()},
                      path,
                      response.result_int());
    }
    return response;
}

HttpResponse RequestRouter::make_json_response(const HttpRequest& request, std::string body) const {
    HttpResponse response{http::status::ok, request.version()};
    response.set(http::field::server, server_banner());
    response.set(http::field::content_type, "application/json");
    response.keep_alive(false);
    response.body() = std::move(body);
    response.prepare_payload();
    return response;
}

HttpResponse RequestRouter::make_not_found(const HttpRequest& request) const {
    HttpResponse response{http::status::not_found, request.version()};
    response.set(http::field::server, server_banner());
    response.keep_alive(false);
    response.prepare_payload();
    return response;
}

}  // namespace uav_mock
