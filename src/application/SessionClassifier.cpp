#include "application/SessionClassifier.hpp"
#include "domain/EngineErrors.hpp"
#include <iostream>

namespace assetbridge::application {

SessionClassifier::SessionClassifier(std::chrono::system_clock::time_point startedAt)
    : m_startedAt(startedAt) {}

bool SessionClassifier::isSessionAsset(const domain::Asset& asset) const {
    return asset.modifiedAt > m_startedAt;
}

void SessionClassifier::resetSession(std::chrono::system_clock::time_point newStart) {
    if (newStart < m_startedAt) {
        throw domain::OutOfOrderResetError();
    }
    if (newStart == m_startedAt) return;

    m_startedAt = newStart;
    std::cout << "[SessionClassifier] New session started" << std::endl;
}

} // namespace assetbridge::application
