// =================================================================
// include/Repodump/FileCollector.hpp
// =================================================================
// Header for walking the scan root and producing file records.

#pragma once

#include "FileRecord.hpp"
#include "PathMatcher.hpp"
#include "TextCodec.hpp"
#include "TokenEstimator.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Repodump {

/**
 * @brief Counters gathered during one walk
 */
struct CollectionStats {
    size_t directories_visited = 0;
    size_t files_seen = 0;
    size_t excluded_paths = 0;          ///< files and directories rejected by the matcher
    size_t gitignore_files = 0;
    size_t unreadable_directories = 0;
    size_t symlinks_outside_root = 0;
    size_t cycles_skipped = 0;
    std::uint64_t bytes_loaded = 0;     ///< content bytes held in memory
    std::vector<std::string> warnings;
};

/**
 * @brief Records in walk order plus the walk's counters
 */
struct CollectionResult {
    std::vector<FileRecord> records;
    CollectionStats stats;
};

/**
 * @brief Walks a directory tree and turns every eligible file into a record
 *
 * Entries are visited depth-first in byte order of their names, so an
 * unchanged tree always yields the same record sequence. Directories the
 * matcher excludes are never opened. Each directory's .gitignore is fed to
 * the matcher before its entries are examined.
 */
class FileCollector {
public:
    /// Bytes sampled for binary detection
    static constexpr size_t kSniffSize = 8192;

    /**
     * @brief Construct a new FileCollector
     * @param root_path The root directory to walk
     */
    explicit FileCollector(const std::string& root_path);

    /**
     * @brief Walk the root and collect file records
     * @param matcher Path filter; receives gitignore rules found on the way
     * @return Records in walk order and walk statistics
     */
    CollectionResult collect(PathMatcher& matcher) const;

    /**
     * @brief Set maximum file size to read (unset = unlimited)
     */
    void setMaxFileSize(std::optional<std::uint64_t> max_size);

    /**
     * @brief Choose strict (content sniffing) or lenient (extension) binary detection
     */
    void setBinaryStrict(bool strict);

    void setEncoding(TextEncoding encoding);
    void setTokenEstimator(const TokenEstimator& estimator);

    /**
     * @brief Decide whether a file looks binary
     * @param file_name File name used for extension checks
     * @param sample Leading bytes of the file
     * @param strict Strict mode flag
     * @return true if the file should be skipped as binary
     */
    static bool looksBinary(const std::string& file_name, const std::string& sample, bool strict);

    static bool hasBinaryExtension(const std::string& file_name);
    static bool hasTextExtension(const std::string& file_name);

private:
    std::filesystem::path m_root_path;
    std::optional<std::uint64_t> m_max_file_size;
    bool m_binary_strict;
    TextCodec m_codec;
    TokenEstimator m_estimator;

    void walkDirectory(const std::filesystem::path& directory,
                       const std::vector<std::string>& relative,
                       const std::filesystem::path& canonical_root,
                       PathMatcher& matcher,
                       std::vector<std::filesystem::path>& active_directories,
                       CollectionResult& result) const;

    FileRecord collectFile(const std::filesystem::path& file_path,
                           std::vector<std::string> relative,
                           CollectionStats& stats) const;

    void loadGitignore(const std::filesystem::path& directory,
                       const std::vector<std::string>& relative,
                       PathMatcher& matcher,
                       CollectionStats& stats) const;

    static bool readFile(const std::filesystem::path& file_path, std::string& bytes);
    static bool isWithin(const std::filesystem::path& path, const std::filesystem::path& root);
};

} // namespace Repodump
