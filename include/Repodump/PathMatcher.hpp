// =================================================================
// include/Repodump/PathMatcher.hpp
// =================================================================
// Header for deciding which paths under the scan root take part in a dump.

#pragma once

#include "IgnorePattern.hpp"
#include <regex>
#include <string>
#include <vector>

namespace Repodump {

/**
 * @brief A user-supplied include or exclude glob
 *
 * Backslashes are read as separators, and leading "./" and trailing '/'
 * are dropped. A glob without '/' is tried against every segment of the
 * path, so "node_modules" or "*.log" hit at any depth. A glob with '/' is
 * anchored at the scan root and matches the path or any ancestor of it.
 */
class GlobPattern {
public:
    /**
     * @throws ConfigError if the glob is empty or malformed
     */
    explicit GlobPattern(const std::string& pattern);

    bool matches(const std::vector<std::string>& segments) const;

    /**
     * @brief Include-side check for a file: a wildcard glob without '/'
     *        only sees the file name, not the directories above it
     */
    bool matchesFile(const std::vector<std::string>& segments) const;

    const std::string& getPattern() const { return m_original_pattern; }
    const std::string& normalized() const { return m_normalized; }

    /**
     * @brief Normalize a user glob the way the constructor does
     */
    static std::string normalize(const std::string& pattern);

private:
    std::string m_original_pattern;
    std::string m_normalized;
    bool m_is_anchored;
    bool m_is_bare;
    std::regex m_regex;
};

/**
 * @brief Combines include globs, exclude globs and gitignore rules
 *
 * Per path: a file matching no include glob (when any are given) is
 * excluded; then any exclude glob excludes; then, if enabled, the
 * gitignore rules decide. Exclude globs therefore beat both include
 * globs and gitignore negation.
 */
class PathMatcher {
public:
    PathMatcher() = default;

    /**
     * @brief Build a matcher from user globs
     *
     * Adds the implicit ".git" exclusion unless an include glob names it.
     *
     * @throws ConfigError on malformed globs or a glob present in both lists
     */
    static PathMatcher create(const std::vector<std::string>& include_globs,
                              const std::vector<std::string>& exclude_globs,
                              bool use_gitignore);

    void addIncludeGlob(const std::string& pattern);
    void addExcludeGlob(const std::string& pattern);
    void setGitignoreEnabled(bool enabled) { m_gitignore_enabled = enabled; }
    bool gitignoreEnabled() const { return m_gitignore_enabled; }

    /**
     * @brief Add the rules of one .gitignore
     * @param text File contents
     * @param scope Segments of the directory holding the file
     * @return Number of rules added
     */
    size_t addGitignoreRules(const std::string& text, const std::vector<std::string>& scope);

    /**
     * @brief Check whether a path is excluded from the dump
     * @param relative_path Segments relative to the scan root
     * @param is_directory True for directories (include globs do not apply)
     * @return true if the path, and for directories its subtree, is excluded
     */
    bool isExcluded(const std::vector<std::string>& relative_path, bool is_directory) const;

    bool isExcluded(const std::string& relative_path, bool is_directory) const;

    size_t gitignoreRuleCount() const { return m_gitignore.size(); }

private:
    std::vector<GlobPattern> m_include;
    std::vector<GlobPattern> m_exclude;
    IgnorePatternSet m_gitignore;
    bool m_gitignore_enabled = true;
};

} // namespace Repodump
