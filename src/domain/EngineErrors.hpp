/**
 * @file EngineErrors.hpp
 * @brief Exception types raised by engine operations.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace assetbridge::domain {

/**
 * @class NotFoundError
 * @brief Raised when an operation names a path the engine has never discovered.
 */
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& path)
        : std::runtime_error("Asset not found: " + path), m_path(path) {}

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

/**
 * @class OutOfOrderResetError
 * @brief Raised when a session reset would move the session start backwards.
 */
class OutOfOrderResetError : public std::runtime_error {
public:
    OutOfOrderResetError()
        : std::runtime_error("Session reset rejected: new start precedes the current session start") {}
};

} // namespace assetbridge::domain
