// =================================================================
// src/Repodump/TreeAggregator.cpp
// =================================================================
// Implementation for directory tree construction and ordering.

#include "Repodump/TreeAggregator.hpp"
#include "Repodump/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace Repodump {

namespace {

std::string lowercase(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

// Case-insensitive, then byte order so "a" and "A" still sort stably
bool nameLess(const std::string& a, const std::string& b) {
    std::string lower_a = lowercase(a);
    std::string lower_b = lowercase(b);
    if (lower_a != lower_b) {
        return lower_a < lower_b;
    }
    return a < b;
}

} // namespace

SortKey parseSortKey(const std::string& value) {
    std::string key = lowercase(value);
    if (key == "name") {
        return SortKey::Name;
    }
    if (key == "size") {
        return SortKey::Size;
    }
    if (key == "tokens") {
        return SortKey::Tokens;
    }
    throw ConfigError("unknown tree sort key '" + value + "' (expected name, size or tokens)");
}

std::string sortKeyName(SortKey key) {
    switch (key) {
        case SortKey::Name: return "name";
        case SortKey::Size: return "size";
        case SortKey::Tokens: return "tokens";
        default: return "unknown";
    }
}

std::uint64_t TreeEntry::tokens() const {
    if (directory) {
        return directory->aggregate_tokens;
    }
    return file ? file->token_count : 0;
}

std::uint64_t TreeEntry::size() const {
    if (directory) {
        return directory->aggregate_size;
    }
    return file ? file->size_bytes : 0;
}

DirectoryTree::DirectoryTree() : m_root(std::make_unique<DirectoryNode>()) {}

bool DirectoryTree::isCollapsed(const DirectoryNode& node) const {
    return m_options.depth_limit && node.depth >= *m_options.depth_limit;
}

std::vector<const TreeEntry*> DirectoryTree::visibleChildren(const DirectoryNode& node) const {
    std::vector<const TreeEntry*> ordered;
    if (isCollapsed(node)) {
        return ordered;
    }

    ordered.reserve(node.children.size());
    for (const auto& child : node.children) {
        ordered.push_back(&child.second);
    }

    const TreeOptions& options = m_options;
    std::sort(ordered.begin(), ordered.end(), [&options](const TreeEntry* a, const TreeEntry* b) {
        if (a->isDirectory() != b->isDirectory()) {
            return options.dirs_first ? a->isDirectory() : b->isDirectory();
        }
        switch (options.sort_key) {
            case SortKey::Size:
                if (a->size() != b->size()) {
                    return a->size() > b->size();
                }
                break;
            case SortKey::Tokens:
                if (a->tokens() != b->tokens()) {
                    return a->tokens() > b->tokens();
                }
                break;
            case SortKey::Name:
                break;
        }
        return nameLess(a->name, b->name);
    });
    return ordered;
}

size_t DirectoryTree::visibleDirectoryCount() const {
    size_t directories = 0;
    size_t files = 0;
    countVisible(*m_root, directories, files);
    return directories;
}

size_t DirectoryTree::visibleFileCount() const {
    size_t directories = 0;
    size_t files = 0;
    countVisible(*m_root, directories, files);
    return files;
}

void DirectoryTree::countVisible(const DirectoryNode& node, size_t& directories, size_t& files) const {
    for (const TreeEntry* entry : visibleChildren(node)) {
        if (entry->isDirectory()) {
            directories++;
            countVisible(*entry->directory, directories, files);
        } else {
            files++;
        }
    }
}

DirectoryTree TreeAggregator::build(const std::vector<FileRecord>& records, const TreeOptions& options) {
    DirectoryTree tree;
    tree.m_options = options;

    for (const auto& record : records) {
        insert(*tree.m_root, record);
    }

    computeAggregates(*tree.m_root);
    return tree;
}

DirectoryTree TreeAggregator::build(const std::vector<FileRecord>& records,
                                    std::optional<size_t> depth_limit,
                                    SortKey sort_key,
                                    bool dirs_first) {
    TreeOptions options;
    options.depth_limit = depth_limit;
    options.sort_key = sort_key;
    options.dirs_first = dirs_first;
    return build(records, options);
}

void TreeAggregator::insert(DirectoryNode& root, const FileRecord& record) {
    if (record.relative_path.empty()) {
        throw std::logic_error("file record without a path");
    }

    DirectoryNode* node = &root;
    for (size_t i = 0; i + 1 < record.relative_path.size(); ++i) {
        const std::string& segment = record.relative_path[i];
        TreeEntry& entry = node->children[segment];
        if (entry.file) {
            throw std::logic_error("path " + record.pathString() + " runs through file " + segment);
        }
        if (!entry.directory) {
            entry.name = segment;
            entry.directory = std::make_unique<DirectoryNode>();
            entry.directory->name = segment;
            entry.directory->depth = node->depth + 1;
        }
        node = entry.directory.get();
    }

    const std::string& file_name = record.relative_path.back();
    TreeEntry& entry = node->children[file_name];
    if (entry.file || entry.directory) {
        throw std::logic_error("duplicate tree entry for " + record.pathString());
    }
    entry.name = file_name;
    entry.file = &record;
}

void TreeAggregator::computeAggregates(DirectoryNode& node) {
    node.aggregate_tokens = 0;
    node.aggregate_size = 0;
    for (auto& child : node.children) {
        TreeEntry& entry = child.second;
        if (entry.directory) {
            computeAggregates(*entry.directory);
            node.aggregate_tokens += entry.directory->aggregate_tokens;
            node.aggregate_size += entry.directory->aggregate_size;
        } else if (entry.file && carriesContent(entry.file->status())) {
            node.aggregate_tokens += entry.file->token_count;
            node.aggregate_size += entry.file->size_bytes;
        }
    }
}

} // namespace Repodump
