#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "uav_mock/telemetry_generator.hpp"

namespace uav_mock {

/** @brief Insertion-ordered JSON so bodies keep the documented field order. */
using Json = nlohmann::ordered_json;

/** @brief Nested `data` object of the state endpoint. */
[[nodiscard]] Json to_json(const TelemetrySnapshot& snapshot);

/** @brief `{"status": "healthy", "uav_id": ...}` */
[[nodiscard]] Json make_health_document(std::string_view uav_id);

/** @brief `{"status": "success", "data": ...}` */
[[nodiscard]] Json make_state_document(const TelemetrySnapshot& snapshot);

/**
 * @brief Serialize @p document as a response body.
 *
 * Members are separated by `", "` and keys by `": "`. Non-ASCII text is
 * escaped as `\uXXXX`; invalid UTF-8 bytes become U+FFFD instead of failing.
 */
[[nodiscard]] std::string to_body(const Json& document);

}  // namespace uav_mock
