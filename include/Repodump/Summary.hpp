// =================================================================
// include/Repodump/Summary.hpp
// =================================================================
// Header for the per-run counters reported alongside a dump.

#pragma once

#include "BudgetEnforcer.hpp"
#include "FileCollector.hpp"
#include "FileRecord.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Repodump {

/**
 * @brief Totals and skip reasons for one dump
 */
struct ScanSummary {
    size_t included_files = 0;      ///< Included plus Truncated
    size_t truncated_files = 0;
    size_t dropped_files = 0;
    size_t skipped_too_large = 0;
    size_t skipped_binary = 0;
    size_t skipped_excluded = 0;    ///< records (links leaving the root)
    size_t skipped_unreadable = 0;
    size_t excluded_paths = 0;      ///< paths rejected by the matcher
    size_t directories = 0;
    size_t lossy_files = 0;
    std::uint64_t total_tokens = 0;
    std::uint64_t tokens_before_budget = 0;
    std::uint64_t total_bytes = 0;  ///< on-disk size of files carrying content
    std::optional<std::uint64_t> max_tokens;
    bool budget_infeasible = false;
    std::vector<std::string> warnings;
};

/**
 * @brief Count the final records and fold in collection and budget results
 * @param records Final records
 * @param stats Counters from the walk
 * @param budget_result Outcome of the budget pass (its records are not read)
 * @param budget Budget the dump was run with
 * @return Summary
 */
ScanSummary summarize(const std::vector<FileRecord>& records,
                      const CollectionStats& stats,
                      const BudgetResult& budget_result,
                      const Budget& budget);

} // namespace Repodump
