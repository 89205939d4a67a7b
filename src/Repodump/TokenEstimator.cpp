// =================================================================
// src/Repodump/TokenEstimator.cpp
// =================================================================
// Implementation for approximate token counting.

#include "Repodump/TokenEstimator.hpp"

namespace Repodump {

TokenEstimator::TokenEstimator(std::uint64_t bytes_per_token)
    : m_bytes_per_token(bytes_per_token == 0 ? 1 : bytes_per_token) {}

std::uint64_t TokenEstimator::estimate(const std::string& content) const {
    return estimateLength(content.size());
}

std::uint64_t TokenEstimator::estimateLength(std::uint64_t length) const {
    // Rough approximation: 4 characters ~ 1 token for source and English text
    return (length + m_bytes_per_token - 1) / m_bytes_per_token;
}

std::uint64_t TokenEstimator::maxLengthFor(std::uint64_t tokens) const {
    return tokens * m_bytes_per_token;
}

} // namespace Repodump
