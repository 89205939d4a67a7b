// =================================================================
// src/Repodump/FileRecord.cpp
// =================================================================
// Implementation for file records and their status transitions.

#include "Repodump/FileRecord.hpp"
#include <algorithm>
#include <stdexcept>

namespace Repodump {

std::string statusName(FileStatus status) {
    switch (status) {
        case FileStatus::Included: return "included";
        case FileStatus::Truncated: return "truncated";
        case FileStatus::Dropped: return "dropped";
        case FileStatus::SkippedTooLarge: return "skipped_too_large";
        case FileStatus::SkippedBinary: return "skipped_binary";
        case FileStatus::SkippedExcluded: return "skipped_excluded";
        case FileStatus::SkippedUnreadable: return "skipped_unreadable";
        default: return "unknown";
    }
}

bool carriesContent(FileStatus status) {
    return status == FileStatus::Included || status == FileStatus::Truncated;
}

FileRecord::FileRecord(std::vector<std::string> path, std::uint64_t size, FileStatus status)
    : relative_path(std::move(path)), size_bytes(size), m_status(status) {}

std::string FileRecord::pathString() const {
    return joinPath(relative_path);
}

void FileRecord::truncate(std::string truncated_content, std::uint64_t tokens) {
    if (!carriesContent(m_status)) {
        throw std::logic_error("cannot truncate " + pathString() + " in state " + statusName(m_status));
    }
    if (tokens > token_count) {
        throw std::logic_error("truncation of " + pathString() + " would grow its token count");
    }
    content = std::move(truncated_content);
    token_count = tokens;
    m_status = FileStatus::Truncated;
}

void FileRecord::drop() {
    if (!carriesContent(m_status)) {
        throw std::logic_error("cannot drop " + pathString() + " in state " + statusName(m_status));
    }
    content.clear();
    token_count = 0;
    m_status = FileStatus::Dropped;
}

bool pathLess(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end());
}

std::string joinPath(const std::vector<std::string>& segments) {
    std::string joined;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            joined += '/';
        }
        joined += segments[i];
    }
    return joined;
}

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;
    for (char c : path) {
        if (c == '/' || c == '\\') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        segments.push_back(current);
    }
    return segments;
}

} // namespace Repodump
