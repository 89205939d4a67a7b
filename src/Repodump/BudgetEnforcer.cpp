// =================================================================
// src/Repodump/BudgetEnforcer.cpp
// =================================================================
// Implementation for largest-first token budget enforcement.

#include "Repodump/BudgetEnforcer.hpp"
#include "Repodump/Logger.hpp"
#include "Repodump/TextCodec.hpp"
#include <algorithm>
#include <limits>

namespace Repodump {

const std::string BudgetEnforcer::kTruncationMarker = "\n[... truncated to fit token budget ...]\n";

BudgetEnforcer::BudgetEnforcer(const TokenEstimator& estimator)
    : m_estimator(estimator) {}

BudgetResult BudgetEnforcer::enforce(std::vector<FileRecord> records, const Budget& budget) const {
    BudgetResult result;
    result.records = std::move(records);

    std::uint64_t smallest = std::numeric_limits<std::uint64_t>::max();
    std::vector<size_t> candidates;
    for (size_t i = 0; i < result.records.size(); ++i) {
        const FileRecord& record = result.records[i];
        if (!carriesContent(record.status())) {
            continue;
        }
        result.tokens_before += record.token_count;
        if (record.token_count > 0) {
            candidates.push_back(i);
            smallest = std::min(smallest, record.token_count);
        }
    }

    std::uint64_t total = result.tokens_before;
    if (!budget.max_tokens || total <= *budget.max_tokens) {
        result.total_tokens = total;
        return result;
    }

    const std::uint64_t cap = *budget.max_tokens;
    result.infeasible = cap < smallest;

    // Token counts only shrink as we go, so one ordering by size serves
    // every round of picking the current largest record
    std::sort(candidates.begin(), candidates.end(), [&](size_t a, size_t b) {
        const FileRecord& left = result.records[a];
        const FileRecord& right = result.records[b];
        if (left.token_count != right.token_count) {
            return left.token_count > right.token_count;
        }
        return pathLess(left.relative_path, right.relative_path);
    });

    for (size_t index : candidates) {
        if (total <= cap) {
            break;
        }

        FileRecord& record = result.records[index];
        std::uint64_t excess = total - cap;

        if (record.token_count > excess) {
            std::string truncated = truncateToFit(record.content, record.token_count - excess);
            if (!truncated.empty()) {
                std::uint64_t tokens = m_estimator.estimate(truncated);
                total -= record.token_count - tokens;
                LOG_DEBUG("BudgetEnforcer", "Truncated " + record.pathString() + " from " +
                          std::to_string(record.token_count) + " to " + std::to_string(tokens) + " tokens");
                record.truncate(std::move(truncated), tokens);
                result.truncated_count++;
                continue;
            }
        }

        total -= record.token_count;
        LOG_DEBUG("BudgetEnforcer", "Dropped " + record.pathString() + " (" +
                  std::to_string(record.token_count) + " tokens)");
        record.drop();
        result.dropped_count++;
    }

    result.total_tokens = total;
    return result;
}

std::string BudgetEnforcer::truncateToFit(const std::string& content, std::uint64_t target_tokens) const {
    if (content.empty()) {
        return "";
    }

    const std::uint64_t max_length = m_estimator.maxLengthFor(target_tokens);
    const size_t first_char = std::max<size_t>(1, TextCodec::utf8SequenceLength(content, 0));
    if (max_length < kTruncationMarker.size() + first_char) {
        return "";
    }

    size_t keep = static_cast<size_t>(std::min<std::uint64_t>(max_length - kTruncationMarker.size(),
                                                              content.size() - 1));
    keep = std::max(TextCodec::utf8Boundary(content, keep), first_char);

    // Prefer ending on a complete line when one is reasonably close
    size_t last_newline = content.rfind('\n', keep - 1);
    if (last_newline != std::string::npos && last_newline + 1 > keep / 2) {
        keep = last_newline + 1;
    }

    std::string truncated = content.substr(0, keep);
    truncated += kTruncationMarker;
    return truncated;
}

} // namespace Repodump
