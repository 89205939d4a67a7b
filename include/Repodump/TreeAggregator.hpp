// =================================================================
// include/Repodump/TreeAggregator.hpp
// =================================================================
// Header for the aggregated directory tree over final file records.

#pragma once

#include "FileRecord.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Repodump {

/**
 * @brief Sibling ordering for the rendered tree
 */
enum class SortKey {
    Name,
    Size,
    Tokens
};

/**
 * @brief Parse "name", "size" or "tokens"
 * @throws ConfigError for any other value
 */
SortKey parseSortKey(const std::string& value);

std::string sortKeyName(SortKey key);

struct DirectoryNode;

/**
 * @brief A child slot of a directory: an owned subdirectory or a file
 *
 * Files are referenced, not owned; the records must outlive the tree.
 */
struct TreeEntry {
    std::string name;
    std::unique_ptr<DirectoryNode> directory;
    const FileRecord* file = nullptr;

    bool isDirectory() const { return directory != nullptr; }

    /// Aggregate for directories, the record's own counts for files
    std::uint64_t tokens() const;
    std::uint64_t size() const;
};

/**
 * @brief Directory in the aggregated tree
 *
 * aggregate_tokens and aggregate_size cover every descendant record that
 * is Included or Truncated.
 */
struct DirectoryNode {
    std::string name;
    size_t depth = 0;
    std::map<std::string, TreeEntry> children;
    std::uint64_t aggregate_tokens = 0;
    std::uint64_t aggregate_size = 0;
};

struct TreeOptions {
    std::optional<size_t> depth_limit;   ///< root is depth 0; unset = unlimited
    SortKey sort_key = SortKey::Name;
    bool dirs_first = true;
};

/**
 * @brief Read-only view of the built tree with render ordering applied
 */
class DirectoryTree {
public:
    DirectoryTree();

    const DirectoryNode& root() const { return *m_root; }
    const TreeOptions& options() const { return m_options; }

    /**
     * @brief Children in render order; empty when the node is collapsed
     */
    std::vector<const TreeEntry*> visibleChildren(const DirectoryNode& node) const;

    /**
     * @brief Whether a node's children are hidden by the depth limit
     */
    bool isCollapsed(const DirectoryNode& node) const;

    size_t visibleDirectoryCount() const;
    size_t visibleFileCount() const;

private:
    friend class TreeAggregator;

    std::unique_ptr<DirectoryNode> m_root;
    TreeOptions m_options;

    void countVisible(const DirectoryNode& node, size_t& directories, size_t& files) const;
};

/**
 * @brief Builds the directory tree once the record set is final
 */
class TreeAggregator {
public:
    /**
     * @brief Build the tree and compute aggregates bottom-up
     * @param records Final records (all statuses are placed in the tree)
     * @param options Depth limit and sibling ordering
     * @return Tree referencing the records
     * @throws std::logic_error if two records claim the same path or a file
     *         path is also used as a directory
     */
    static DirectoryTree build(const std::vector<FileRecord>& records, const TreeOptions& options);

    static DirectoryTree build(const std::vector<FileRecord>& records,
                               std::optional<size_t> depth_limit,
                               SortKey sort_key,
                               bool dirs_first);

private:
    static void insert(DirectoryNode& root, const FileRecord& record);
    static void computeAggregates(DirectoryNode& node);
};

} // namespace Repodump
