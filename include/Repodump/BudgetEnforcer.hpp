// =================================================================
// include/Repodump/BudgetEnforcer.hpp
// =================================================================
// Header for fitting the collected files under a token cap.

#pragma once

#include "FileRecord.hpp"
#include "TokenEstimator.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace Repodump {

/**
 * @brief Outcome of one budget pass
 */
struct BudgetResult {
    std::vector<FileRecord> records;     ///< same order as the input
    std::uint64_t total_tokens = 0;      ///< sum of the final token counts
    std::uint64_t tokens_before = 0;     ///< sum before enforcement
    size_t truncated_count = 0;
    size_t dropped_count = 0;
    bool infeasible = false;             ///< cap below the smallest non-empty file
};

/**
 * @brief Truncates or drops the largest files until the dump fits the cap
 *
 * The record with the most tokens is shortened first (ties go to the
 * smaller path), so small files survive whole at the expense of the few
 * largest contributors. A record is cut to the longest prefix that, with
 * the truncation marker appended, still fits what the cap leaves it; if
 * not even a one-character stub fits, the record is dropped and the next
 * largest is considered.
 */
class BudgetEnforcer {
public:
    /// Appended to every truncated record
    static const std::string kTruncationMarker;

    explicit BudgetEnforcer(const TokenEstimator& estimator = TokenEstimator());

    /**
     * @brief Apply a budget to collected records
     * @param records Records in collection order
     * @param budget Budget; only max_tokens is consulted here
     * @return Final records and totals
     */
    BudgetResult enforce(std::vector<FileRecord> records, const Budget& budget) const;

    /**
     * @brief Cut content so that prefix plus marker fits a token target
     * @param content Original content
     * @param target_tokens Tokens available to this record
     * @return Truncated content ending with the marker, or empty if even
     *         a one-character stub does not fit
     */
    std::string truncateToFit(const std::string& content, std::uint64_t target_tokens) const;

private:
    TokenEstimator m_estimator;
};

} // namespace Repodump
