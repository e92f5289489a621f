#include <filesystem>
#include <optional>
#include <string>

#include <catch2/catch.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/details/log_msg.h>

#include "uav_mock/logging.hpp"

using namespace uav_mock;

TEST_CASE("Without a log directory only the console sink is created") {
    const auto sinks = make_log_sinks(std::nullopt);

    REQUIRE(sinks.size() == 1);
}

TEST_CASE("A log directory adds a rotating file sink") {
    const auto log_dir = std::filesystem::temp_directory_path() / "uav_mock_sink_test" / "nested";
    std::error_code error_remove;
    std::filesystem::remove_all(log_dir, error_remove);

    const auto sinks = make_log_sinks(log_dir.string());

    REQUIRE(sinks.size() == 2);
    REQUIRE(std::filesystem::is_directory(log_dir));
}

TEST_CASE("JSON-line formatter escapes the message") {
    const auto formatter = make_json_line_formatter();
    const std::string message{R"(uav_id="UAV-"7"" path=C:\logs)"};
    const spdlog::details::log_msg msg{"uav_mock", spdlog::level::warn, message};

    spdlog::memory_buf_t buffer;
    formatter->format(msg, buffer);
    const auto line = nlohmann::json::parse(fmt::to_string(buffer));

    REQUIRE(line.at("msg") == message);
    REQUIRE(line.at("level") == "warning");
    REQUIRE(line.at("ts").get<std::string>().back() == 'Z');
}
