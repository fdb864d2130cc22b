#pragma once

#include <stdexcept>
#include <string>

namespace sextant::config {

// Raised while loading or validating layout configuration, never during a layout pass
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

}  // namespace sextant::config
