#include "uav_mock/telemetry_json.hpp"

#include <string>

namespace uav_mock {

namespace {

std::string dump_scalar(const Json& value) {
    return value.dump(-1, ' ', true, Json::error_handler_t::replace);
}

void append_value(const Json& value, std::string& body) {
    if (value.is_object()) {
        body += '{';
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (it != value.begin()) {
                body += ", ";
            }
            body += dump_scalar(Json(it.key()));
            body += ": ";
            append_value(it.value(), body);
        }
        body += '}';
    } else if (value.is_array()) {
        body += '[';
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (it != value.begin()) {
                body += ", ";
            }
            append_value(*it, body);
        }
        body += ']';
    } else {
        body += dump_scalar(value);
    }
}

}  // namespace

Json to_json(const TelemetrySnapshot& snapshot) {
    Json document = Json::object();
    document["uav_id"] = snapshot.uav_id;
    document["node_name"] = snapshot.node_name;
    document["system_time"] = snapshot.system_time;
    document["gps"] = {
        {"latitude", snapshot.gps.latitude_deg},
        {"longitude", snapshot.gps.longitude_deg},
        {"altitude", snapshot.gps.altitude_m},
        {"satellite_count", snapshot.gps.satellite_count},
        {"fix_type", snapshot.gps.fix_type},
    };
    document["battery"] = {
        {"voltage", snapshot.battery.voltage_v},
        {"remaining_percent", snapshot.battery.remaining_percent},
        {"temperature", snapshot.battery.temperature_c},
    };
    document["flight"] = {
        {"mode", snapshot.flight.mode},
        {"armed", snapshot.flight.armed},
        {"ground_speed", snapshot.flight.ground_speed_mps},
    };
    document["health"] = {
        {"system_status", std::string{to_string(snapshot.system_status)}},
    };
    return document;
}

Json make_health_document(std::string_view uav_id) {
    Json document = Json::object();
    document["status"] = "healthy";
    document["uav_id"] = std::string{uav_id};
    return document;
}

Json make_state_document(const TelemetrySnapshot& snapshot) {
    Json document = Json::object();
    document["status"] = "success";
    document["data"] = to_json(snapshot);
    return document;
}

std::string to_body(const Json& document) {
    std::string body;
    append_value(document, body);
    return body;
}

}  // namespace uav_mock
