// =================================================================
// src/Repodump/Summary.cpp
// =================================================================
// Implementation for dump summaries.

#include "Repodump/Summary.hpp"

namespace Repodump {

ScanSummary summarize(const std::vector<FileRecord>& records,
                      const CollectionStats& stats,
                      const BudgetResult& budget_result,
                      const Budget& budget) {
    ScanSummary summary;
    summary.excluded_paths = stats.excluded_paths;
    summary.directories = stats.directories_visited;
    summary.tokens_before_budget = budget_result.tokens_before;
    summary.max_tokens = budget.max_tokens;
    summary.budget_infeasible = budget_result.infeasible;
    summary.warnings = stats.warnings;

    for (const auto& record : records) {
        switch (record.status()) {
            case FileStatus::Truncated:
                summary.truncated_files++;
                [[fallthrough]];
            case FileStatus::Included:
                summary.included_files++;
                summary.total_tokens += record.token_count;
                summary.total_bytes += record.size_bytes;
                break;
            case FileStatus::Dropped:
                summary.dropped_files++;
                break;
            case FileStatus::SkippedTooLarge:
                summary.skipped_too_large++;
                break;
            case FileStatus::SkippedBinary:
                summary.skipped_binary++;
                break;
            case FileStatus::SkippedExcluded:
                summary.skipped_excluded++;
                break;
            case FileStatus::SkippedUnreadable:
                summary.skipped_unreadable++;
                break;
        }
        if (record.lossy_decoded) {
            summary.lossy_files++;
        }
    }

    if (budget_result.infeasible && budget.max_tokens) {
        summary.warnings.push_back("token budget " + std::to_string(*budget.max_tokens) +
                                   " is smaller than the smallest file");
    }
    if (summary.lossy_files > 0) {
        summary.warnings.push_back(std::to_string(summary.lossy_files) +
                                   " file(s) contained bytes invalid for the input encoding");
    }

    return summary;
}

} // namespace Repodump
