// =================================================================
// include/Repodump/Errors.hpp
// =================================================================
// Exception types raised before a dump starts.

#pragma once

#include <stdexcept>
#include <string>

namespace Repodump {

/**
 * @brief Invalid configuration detected before traversal begins
 *
 * Covers malformed globs, conflicting include/exclude patterns,
 * non-positive budgets and unknown option values.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace Repodump
