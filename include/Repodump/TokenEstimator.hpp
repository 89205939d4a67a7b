// =================================================================
// include/Repodump/TokenEstimator.hpp
// =================================================================
// Header for approximate token counting.

#pragma once

#include <cstdint>
#include <string>

namespace Repodump {

/**
 * @brief Approximates token counts from content length
 *
 * The estimate is ceil(bytes / bytes_per_token). It depends on nothing but
 * the content, never decreases as content grows, and returns 0 for empty
 * content.
 */
class TokenEstimator {
public:
    static constexpr std::uint64_t kDefaultBytesPerToken = 4;

    /**
     * @brief Construct an estimator
     * @param bytes_per_token Bytes counted as one token (0 is treated as 1)
     */
    explicit TokenEstimator(std::uint64_t bytes_per_token = kDefaultBytesPerToken);

    /**
     * @brief Estimate token count for text
     * @param content Text to estimate
     * @return Estimated token count
     */
    std::uint64_t estimate(const std::string& content) const;

    /**
     * @brief Estimate token count for a byte length
     */
    std::uint64_t estimateLength(std::uint64_t length) const;

    /**
     * @brief Largest byte length whose estimate does not exceed a token count
     */
    std::uint64_t maxLengthFor(std::uint64_t tokens) const;

    std::uint64_t bytesPerToken() const { return m_bytes_per_token; }

private:
    std::uint64_t m_bytes_per_token;
};

} // namespace Repodump
