// =================================================================
// src/Repodump/PathMatcher.cpp
// =================================================================
// Implementation for include/exclude/gitignore path filtering.

#include "Repodump/PathMatcher.hpp"
#include "Repodump/Errors.hpp"
#include "Repodump/FileRecord.hpp"
#include <algorithm>

namespace Repodump {

std::string GlobPattern::normalize(const std::string& pattern) {
    std::string normalized = pattern;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');

    while (normalized.compare(0, 2, "./") == 0) {
        normalized.erase(0, 2);
    }
    while (!normalized.empty() && normalized.front() == '/') {
        normalized.erase(0, 1);
    }
    while (!normalized.empty() && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

GlobPattern::GlobPattern(const std::string& pattern)
    : m_original_pattern(pattern),
      m_normalized(normalize(pattern)),
      m_is_anchored(false),
      m_is_bare(false)
{
    if (m_normalized.empty() || m_normalized == ".") {
        throw ConfigError("empty glob pattern '" + pattern + "'");
    }

    m_is_anchored = m_normalized.find('/') != std::string::npos;
    m_is_bare = isBareSegment(m_normalized);
    if (m_is_bare) {
        return;
    }

    try {
        m_regex = std::regex(globToRegex(m_normalized), std::regex_constants::ECMAScript);
    } catch (const std::regex_error& e) {
        throw ConfigError("invalid glob pattern '" + pattern + "': " + e.what());
    }
}

bool GlobPattern::matches(const std::vector<std::string>& segments) const {
    if (m_is_bare) {
        return std::find(segments.begin(), segments.end(), m_normalized) != segments.end();
    }

    if (!m_is_anchored) {
        for (const auto& segment : segments) {
            if (std::regex_match(segment, m_regex)) {
                return true;
            }
        }
        return false;
    }

    std::string prefix;
    for (const auto& segment : segments) {
        if (!prefix.empty()) {
            prefix += '/';
        }
        prefix += segment;
        if (std::regex_match(prefix, m_regex)) {
            return true;
        }
    }
    return false;
}

bool GlobPattern::matchesFile(const std::vector<std::string>& segments) const {
    if (m_is_bare || m_is_anchored) {
        return matches(segments);
    }
    return !segments.empty() && std::regex_match(segments.back(), m_regex);
}

PathMatcher PathMatcher::create(const std::vector<std::string>& include_globs,
                                const std::vector<std::string>& exclude_globs,
                                bool use_gitignore) {
    PathMatcher matcher;
    matcher.setGitignoreEnabled(use_gitignore);

    bool git_included = false;
    for (const auto& pattern : include_globs) {
        matcher.addIncludeGlob(pattern);
        if (GlobPattern::normalize(pattern).compare(0, 4, ".git") == 0) {
            git_included = true;
        }
    }

    for (const auto& pattern : exclude_globs) {
        std::string normalized = GlobPattern::normalize(pattern);
        for (const auto& include : matcher.m_include) {
            if (include.normalized() == normalized) {
                throw ConfigError("pattern '" + pattern + "' is both included and excluded");
            }
        }
        matcher.addExcludeGlob(pattern);
    }

    if (!git_included) {
        matcher.addExcludeGlob(".git");
    }
    return matcher;
}

void PathMatcher::addIncludeGlob(const std::string& pattern) {
    m_include.emplace_back(pattern);
}

void PathMatcher::addExcludeGlob(const std::string& pattern) {
    m_exclude.emplace_back(pattern);
}

size_t PathMatcher::addGitignoreRules(const std::string& text, const std::vector<std::string>& scope) {
    return m_gitignore.loadFromString(text, scope);
}

bool PathMatcher::isExcluded(const std::vector<std::string>& relative_path, bool is_directory) const {
    if (relative_path.empty()) {
        return false;
    }

    if (!is_directory && !m_include.empty()) {
        bool included = std::any_of(m_include.begin(), m_include.end(),
                                    [&](const GlobPattern& glob) { return glob.matchesFile(relative_path); });
        if (!included) {
            return true;
        }
    }

    for (const auto& glob : m_exclude) {
        if (glob.matches(relative_path)) {
            return true;
        }
    }

    if (m_gitignore_enabled && m_gitignore.size() > 0) {
        return m_gitignore.shouldIgnore(joinPath(relative_path), is_directory);
    }
    return false;
}

bool PathMatcher::isExcluded(const std::string& relative_path, bool is_directory) const {
    return isExcluded(splitPath(relative_path), is_directory);
}

} // namespace Repodump
