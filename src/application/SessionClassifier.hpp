/**
 * @file SessionClassifier.hpp
 * @brief Splits assets into the current generation session and history.
 */

#pragma once

#include <chrono>
#include "domain/Asset.hpp"

namespace assetbridge::application {

/**
 * @class SessionClassifier
 * @brief Compares asset modification times against a monotonic session start.
 */
class SessionClassifier {
public:
    explicit SessionClassifier(std::chrono::system_clock::time_point startedAt = std::chrono::system_clock::now());

    /** @brief True if the asset was modified after the session started. */
    bool isSessionAsset(const domain::Asset& asset) const;

    /**
     * @brief Moves the session boundary forward for a new generation batch.
     * @throws domain::OutOfOrderResetError if newStart precedes the current start.
     */
    void resetSession(std::chrono::system_clock::time_point newStart);

    std::chrono::system_clock::time_point sessionStart() const { return m_startedAt; }

private:
    std::chrono::system_clock::time_point m_startedAt;
};

} // namespace assetbridge::application
