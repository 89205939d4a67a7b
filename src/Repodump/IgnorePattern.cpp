// =================================================================
// src/Repodump/IgnorePattern.cpp
// =================================================================
// Implementation for gitignore-compatible pattern matching.

#include "Repodump/IgnorePattern.hpp"
#include "Repodump/Errors.hpp"
#include "Repodump/FileRecord.hpp"
#include "Repodump/Logger.hpp"
#include <sstream>

namespace Repodump {

namespace {

void appendLiteral(std::string& regex_pattern, char c) {
    static const std::string special = ".^$|()[]{}*+?\\";
    if (special.find(c) != std::string::npos) {
        regex_pattern += '\\';
    }
    regex_pattern += c;
}

std::string joinSegments(const std::vector<std::string>& segments, size_t first, size_t last) {
    std::string joined;
    for (size_t i = first; i <= last; ++i) {
        if (i > first) {
            joined += '/';
        }
        joined += segments[i];
    }
    return joined;
}

} // namespace

std::string globToRegex(const std::string& glob_pattern) {
    std::string regex_pattern;
    const size_t length = glob_pattern.length();

    for (size_t i = 0; i < length; ++i) {
        char c = glob_pattern[i];

        switch (c) {
            case '*': {
                bool segment_start = (i == 0 || glob_pattern[i - 1] == '/');
                if (i + 1 < length && glob_pattern[i + 1] == '*') {
                    if (segment_start && i + 2 < length && glob_pattern[i + 2] == '/') {
                        // "**/" matches zero or more leading directories
                        regex_pattern += "(?:.*/)?";
                        i += 2;
                    } else if (segment_start && i + 2 == length) {
                        // trailing "**" matches everything below
                        regex_pattern += ".*";
                        i += 1;
                    } else {
                        regex_pattern += "[^/]*";
                        i += 1;
                    }
                } else {
                    regex_pattern += "[^/]*";
                }
                break;
            }

            case '?':
                regex_pattern += "[^/]";
                break;

            case '[': {
                size_t j = i + 1;
                std::string char_class = "[";
                bool negated = false;
                if (j < length && (glob_pattern[j] == '!' || glob_pattern[j] == '^')) {
                    char_class += '^';
                    negated = true;
                    ++j;
                }
                if (j < length && glob_pattern[j] == ']') {
                    char_class += "\\]";
                    ++j;
                }
                bool closed = false;
                for (; j < length; ++j) {
                    char d = glob_pattern[j];
                    if (d == ']') {
                        closed = true;
                        break;
                    }
                    if (d == '\\') {
                        if (j + 1 >= length) {
                            break;
                        }
                        char_class += '\\';
                        char_class += glob_pattern[++j];
                    } else if (d == '[' || d == '^') {
                        char_class += '\\';
                        char_class += d;
                    } else {
                        char_class += d;
                    }
                }
                if (!closed) {
                    throw ConfigError("unterminated character class in pattern '" + glob_pattern + "'");
                }
                if (negated) {
                    char_class += '/';
                }
                char_class += ']';
                regex_pattern += char_class;
                i = j;
                break;
            }

            case '\\':
                if (i + 1 >= length) {
                    throw ConfigError("trailing escape in pattern '" + glob_pattern + "'");
                }
                appendLiteral(regex_pattern, glob_pattern[++i]);
                break;

            default:
                appendLiteral(regex_pattern, c);
                break;
        }
    }

    return regex_pattern;
}

bool isBareSegment(const std::string& glob_pattern) {
    return !glob_pattern.empty() &&
           glob_pattern.find_first_of("/*?[\\") == std::string::npos;
}

IgnorePattern::IgnorePattern(const std::string& pattern, std::vector<std::string> scope)
    : m_original_pattern(pattern),
      m_scope(std::move(scope)),
      m_is_negation(false),
      m_directory_only(false),
      m_is_anchored(false),
      m_is_empty(false)
{
    processPattern(pattern);
}

bool IgnorePattern::matches(const std::string& path, bool is_directory) const {
    std::vector<std::string> segments = splitPath(path);

    // Every ancestor is a directory; the path itself is one only if the caller says so
    for (size_t length = 1; length <= segments.size(); ++length) {
        bool candidate_is_directory = (length < segments.size()) || is_directory;
        if (matchesPrefix(segments, length, candidate_is_directory)) {
            return true;
        }
    }
    return false;
}

bool IgnorePattern::matchesPrefix(const std::vector<std::string>& segments, size_t length,
                                  bool is_directory) const {
    if (m_is_empty || length > segments.size() || length <= m_scope.size()) {
        return false;
    }
    for (size_t i = 0; i < m_scope.size(); ++i) {
        if (segments[i] != m_scope[i]) {
            return false;
        }
    }
    if (m_directory_only && !is_directory) {
        return false;
    }
    return matchesCandidate(segments, length - 1);
}

bool IgnorePattern::matchesCandidate(const std::vector<std::string>& segments, size_t last) const {
    if (m_is_anchored) {
        return std::regex_match(joinSegments(segments, m_scope.size(), last), m_regex);
    }
    return std::regex_match(segments[last], m_regex);
}

void IgnorePattern::processPattern(const std::string& pattern) {
    std::string working_pattern = pattern;

    // Skip empty lines and comments
    if (working_pattern.empty() || working_pattern[0] == '#') {
        m_is_empty = true;
        return;
    }

    // Trailing whitespace is dropped unless escaped
    while (!working_pattern.empty() &&
           (working_pattern.back() == ' ' || working_pattern.back() == '\t' ||
            working_pattern.back() == '\r')) {
        if (working_pattern.size() >= 2 && working_pattern[working_pattern.size() - 2] == '\\') {
            break;
        }
        working_pattern.pop_back();
    }

    if (working_pattern.empty()) {
        m_is_empty = true;
        return;
    }

    // Handle negation patterns
    if (working_pattern[0] == '!') {
        m_is_negation = true;
        working_pattern = working_pattern.substr(1);
    }

    // Handle directory-only patterns
    if (!working_pattern.empty() && working_pattern.back() == '/') {
        m_directory_only = true;
        working_pattern.pop_back();
    }

    // Any remaining separator anchors the pattern to its .gitignore directory
    if (working_pattern.find('/') != std::string::npos) {
        m_is_anchored = true;
        if (working_pattern[0] == '/') {
            working_pattern = working_pattern.substr(1);
        }
    }

    if (working_pattern.empty()) {
        m_is_empty = true;
        return;
    }

    try {
        m_regex = std::regex(globToRegex(working_pattern), std::regex_constants::ECMAScript);
    } catch (const ConfigError& e) {
        LOG_WARNING("IgnorePattern", "Skipping malformed pattern '" + pattern + "': " + e.what());
        m_is_empty = true;
    } catch (const std::regex_error& e) {
        LOG_WARNING("IgnorePattern", "Failed to compile regex for pattern '" + pattern + "': " + e.what());
        m_is_empty = true;
    }
}

// IgnorePatternSet implementation

void IgnorePatternSet::addPattern(const std::string& pattern, const std::vector<std::string>& scope) {
    IgnorePattern ignore_pattern(pattern, scope);
    if (!ignore_pattern.isEmpty()) {
        m_patterns.push_back(std::move(ignore_pattern));
    }
}

size_t IgnorePatternSet::loadFromString(const std::string& text, const std::vector<std::string>& scope) {
    size_t patterns_loaded = 0;
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        IgnorePattern pattern(line, scope);
        if (!pattern.isEmpty()) {
            m_patterns.push_back(std::move(pattern));
            patterns_loaded++;
        }
    }
    return patterns_loaded;
}

bool IgnorePatternSet::shouldIgnore(const std::string& path, bool is_directory) const {
    std::vector<std::string> segments = splitPath(path);

    // Shallowest prefix first: nothing below an ignored directory comes back
    for (size_t length = 1; length <= segments.size(); ++length) {
        bool candidate_is_directory = (length < segments.size()) || is_directory;
        for (auto it = m_patterns.rbegin(); it != m_patterns.rend(); ++it) {
            if (it->matchesPrefix(segments, length, candidate_is_directory)) {
                if (!it->isNegation()) {
                    return true;
                }
                break;
            }
        }
    }
    return false;
}

} // namespace Repodump
