#pragma once

#include "uav_mock/logging.hpp"

#include <cstdlib>
#include <filesystem>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace uav_mock::test {

inline void ensure_logger_initialized() {
    static const std::shared_ptr<spdlog::logger> logger_handle = []() {
        const auto log_dir = std::filesystem::temp_directory_path() / "uav_mock_tests_logs";
        return uav_mock::initialize_logger(log_dir.string());
    }();
    (void)logger_handle;
}

/** @brief Sets or clears environment variables and restores them on exit. */
class ScopedEnvironment final {
  public:
    ScopedEnvironment() = default;
    ScopedEnvironment(const ScopedEnvironment&) = delete;
    ScopedEnvironment& operator=(const ScopedEnvironment&) = delete;

    ~ScopedEnvironment() {
        for (auto it = saved_.rbegin(); it != saved_.rend(); ++it) {
            if (it->second.has_value()) {
                ::setenv(it->first.c_str(), it->second->c_str(), 1);
            } else {
                ::unsetenv(it->first.c_str());
            }
        }
    }

    void set(const std::string& name, const std::string& value) {
        remember(name);
        ::setenv(name.c_str(), value.c_str(), 1);
    }

    void unset(const std::string& name) {
        remember(name);
        ::unsetenv(name.c_str());
    }

    void unset_all(std::initializer_list<const char*> names) {
        for (const char* name : names) {
            unset(name);
        }
    }

  private:
    void remember(const std::string& name) {
        const char* previous = std::getenv(name.c_str());
        saved_.emplace_back(name, previous == nullptr ? std::nullopt : std::optional<std::string>{previous});
    }

    std::vector<std::pair<std::string, std::optional<std::string>>> saved_;
};

}  // namespace uav_mock::test
