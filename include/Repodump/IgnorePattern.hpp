// =================================================================
// include/Repodump/IgnorePattern.hpp
// =================================================================
// Header for gitignore-compatible pattern matching functionality.

#pragma once

#include <string>
#include <vector>
#include <regex>

namespace Repodump {

/**
 * @brief Translate a glob into an ECMAScript regex body
 *
 * '*' and '?' never cross '/', '**' spans directories, "[...]" classes
 * accept '!' or '^' negation and '\' escapes the next character.
 *
 * @param glob_pattern Glob pattern string
 * @return Equivalent regex (without anchors)
 * @throws ConfigError on an unterminated character class or trailing escape
 */
std::string globToRegex(const std::string& glob_pattern);

/**
 * @brief Check whether a glob is a plain path segment (no '/', no wildcards)
 */
bool isBareSegment(const std::string& glob_pattern);

/**
 * @brief Gitignore-compatible pattern matching utility
 *
 * Supports the full range of gitignore pattern syntax including:
 * - Wildcards: *, **, ?, [abc]
 * - Negation: !pattern
 * - Directory-only patterns: pattern/
 * - Anchored patterns: /pattern or dir/pattern
 * - Comment lines: # comment
 *
 * A pattern belongs to the directory whose .gitignore declared it and
 * only applies to paths below that directory. A pattern matches a path
 * when it matches the path itself or any ancestor directory of it.
 */
class IgnorePattern {
public:
    /**
     * @brief Construct a pattern matcher from a gitignore-style pattern
     * @param pattern The pattern string
     * @param scope Segments of the directory the pattern was declared in
     */
    explicit IgnorePattern(const std::string& pattern,
                           std::vector<std::string> scope = {});

    /**
     * @brief Check if a path matches this pattern
     * @param path Relative path from the scan root
     * @param is_directory True if the path is a directory
     * @return true if path matches the pattern
     */
    bool matches(const std::string& path, bool is_directory = false) const;

    /**
     * @brief Check the pattern against one prefix of a path, ignoring its ancestors
     * @param segments Path segments from the scan root
     * @param length Number of leading segments forming the candidate
     * @param is_directory True if the candidate is a directory
     * @return true if the candidate itself matches
     */
    bool matchesPrefix(const std::vector<std::string>& segments, size_t length, bool is_directory) const;

    /**
     * @brief Check if this is a negation pattern (starts with !)
     * @return true if this pattern negates matches
     */
    bool isNegation() const { return m_is_negation; }

    /**
     * @brief Check if this pattern only matches directories
     * @return true if pattern ends with /
     */
    bool isDirectoryOnly() const { return m_directory_only; }

    /**
     * @brief Get the original pattern string
     * @return The pattern as provided to constructor
     */
    const std::string& getPattern() const { return m_original_pattern; }

    /**
     * @brief Number of segments in the declaring directory
     */
    size_t scopeDepth() const { return m_scope.size(); }

    /**
     * @brief Check if pattern is empty, a comment, or failed to compile
     * @return true if pattern should be ignored
     */
    bool isEmpty() const { return m_is_empty; }

private:
    std::string m_original_pattern;
    std::vector<std::string> m_scope;
    bool m_is_negation;
    bool m_directory_only;
    bool m_is_anchored;
    bool m_is_empty;
    std::regex m_regex;

    /**
     * @brief Process the raw pattern into internal representation
     * @param pattern Raw pattern string
     */
    void processPattern(const std::string& pattern);

    bool matchesCandidate(const std::vector<std::string>& segments, size_t last) const;
};

/**
 * @brief Ordered gitignore rules from every .gitignore under the root
 *
 * Rules from a parent directory are added before rules from its
 * subdirectories, and rules within one file keep their file order.
 * A path is ignored when one of its ancestor directories is ignored,
 * or when the path itself is. Each of those prefixes is decided on its
 * own by walking the list from the end: the last rule matching that
 * prefix decides.
 */
class IgnorePatternSet {
public:
    /**
     * @brief Add a pattern to the set
     * @param pattern Pattern string
     * @param scope Segments of the declaring directory
     */
    void addPattern(const std::string& pattern, const std::vector<std::string>& scope = {});

    /**
     * @brief Load patterns from gitignore text
     * @param text Contents of an ignore file
     * @param scope Segments of the directory the text belongs to
     * @return Number of patterns loaded
     */
    size_t loadFromString(const std::string& text, const std::vector<std::string>& scope = {});

    /**
     * @brief Check if a path should be ignored
     * @param path Relative path from the scan root
     * @param is_directory True if path is a directory
     * @return true if path should be ignored
     */
    bool shouldIgnore(const std::string& path, bool is_directory = false) const;

    /**
     * @brief Get number of patterns in the set
     * @return Pattern count
     */
    size_t size() const { return m_patterns.size(); }

    /**
     * @brief Clear all patterns
     */
    void clear() { m_patterns.clear(); }

private:
    std::vector<IgnorePattern> m_patterns;
};

} // namespace Repodump
