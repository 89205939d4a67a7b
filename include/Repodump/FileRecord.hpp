// =================================================================
// include/Repodump/FileRecord.hpp
// =================================================================
// Header for the per-file record and budget value types shared by
// every stage of the dump pipeline.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Repodump {

/**
 * @brief Outcome of a file's trip through the pipeline
 *
 * Included, Truncated and Dropped form a forward-only chain that only the
 * budget pass may walk. The Skipped* states are terminal and assigned by
 * the collector.
 */
enum class FileStatus {
    Included,
    Truncated,
    Dropped,
    SkippedTooLarge,
    SkippedBinary,
    SkippedExcluded,
    SkippedUnreadable
};

/**
 * @brief Get the display name of a status
 * @param status File status
 * @return Lowercase name (e.g., "truncated")
 */
std::string statusName(FileStatus status);

/**
 * @brief Check whether a status carries content into the dump
 * @param status File status
 * @return true for Included and Truncated
 */
bool carriesContent(FileStatus status);

/**
 * @brief One file discovered under the scan root
 */
struct FileRecord {
    std::vector<std::string> relative_path;
    std::uint64_t size_bytes = 0;
    std::uint64_t token_count = 0;
    std::uint64_t original_tokens = 0;
    std::string content;
    bool lossy_decoded = false;

    FileRecord() = default;
    FileRecord(std::vector<std::string> path, std::uint64_t size, FileStatus status);

    FileStatus status() const { return m_status; }

    /**
     * @brief Join the path segments with '/'
     * @return Relative path string
     */
    std::string pathString() const;

    /**
     * @brief Replace content with a truncated prefix
     * @param truncated_content Prefix including the truncation marker
     * @param tokens Token count of the truncated content
     * @throws std::logic_error if the record is not Included or Truncated,
     *         or if tokens exceed the current count
     */
    void truncate(std::string truncated_content, std::uint64_t tokens);

    /**
     * @brief Drop the record from the dump, clearing its content
     * @throws std::logic_error if the record is not Included or Truncated
     */
    void drop();

private:
    FileStatus m_status = FileStatus::Included;
};

/**
 * @brief Lexicographic comparison of segment paths
 */
bool pathLess(const std::vector<std::string>& a, const std::vector<std::string>& b);

/**
 * @brief Join path segments with '/'
 */
std::string joinPath(const std::vector<std::string>& segments);

/**
 * @brief Split a '/'-separated relative path into segments, skipping empty ones
 */
std::vector<std::string> splitPath(const std::string& path);

/**
 * @brief Size and token ceilings for a dump
 */
struct Budget {
    std::optional<std::uint64_t> max_size_bytes;
    std::optional<std::uint64_t> max_tokens;
};

} // namespace Repodump
