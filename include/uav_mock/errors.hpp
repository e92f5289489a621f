#pragma once

#include <stdexcept>

namespace uav_mock {

/** @brief Raised when a numeric environment variable cannot be parsed. */
class ConfigError final : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Raised when the HTTP listener cannot bind its port. */
class BindError final : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

}  // namespace uav_mock
