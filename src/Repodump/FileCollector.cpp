// =================================================================
// src/Repodump/FileCollector.cpp
// =================================================================
// Implementation for file discovery, filtering and loading.

#include "Repodump/FileCollector.hpp"
#include "Repodump/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace fs = std::filesystem;

namespace Repodump {

namespace {

std::string lowercaseExtension(const std::string& file_name) {
    size_t dot_pos = file_name.find_last_of('.');
    if (dot_pos == std::string::npos || dot_pos == 0) {
        return "";
    }
    std::string extension = file_name.substr(dot_pos);
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension;
}

} // namespace

FileCollector::FileCollector(const std::string& root_path)
    : m_root_path(fs::absolute(root_path)),
      m_max_file_size(1024 * 1024), // 1MB default
      m_binary_strict(true)
{
}

void FileCollector::setMaxFileSize(std::optional<std::uint64_t> max_size) {
    m_max_file_size = max_size;
}

void FileCollector::setBinaryStrict(bool strict) {
    m_binary_strict = strict;
}

void FileCollector::setEncoding(TextEncoding encoding) {
    m_codec = TextCodec(encoding);
}

void FileCollector::setTokenEstimator(const TokenEstimator& estimator) {
    m_estimator = estimator;
}

CollectionResult FileCollector::collect(PathMatcher& matcher) const {
    CollectionResult result;

    std::error_code ec;
    fs::path canonical_root = fs::canonical(m_root_path, ec);
    if (ec || !fs::is_directory(canonical_root, ec)) {
        std::string message = "Scan root is not a readable directory: " + m_root_path.string();
        LOG_ERROR("FileCollector", message);
        result.stats.warnings.push_back(message);
        return result;
    }

    std::vector<fs::path> active_directories;
    walkDirectory(m_root_path, {}, canonical_root, matcher, active_directories, result);

    LOG_INFO("FileCollector", "Collected " + std::to_string(result.records.size()) + " files");
    return result;
}

void FileCollector::walkDirectory(const fs::path& directory,
                                  const std::vector<std::string>& relative,
                                  const fs::path& canonical_root,
                                  PathMatcher& matcher,
                                  std::vector<fs::path>& active_directories,
                                  CollectionResult& result) const {
    CollectionStats& stats = result.stats;
    std::string display = relative.empty() ? "." : joinPath(relative);

    std::error_code ec;
    fs::path canonical_dir = fs::canonical(directory, ec);
    if (ec) {
        stats.unreadable_directories++;
        stats.warnings.push_back("cannot resolve directory " + display + ": " + ec.message());
        LOG_WARNING("FileCollector", "Cannot resolve directory", display + ": " + ec.message());
        return;
    }
    if (std::find(active_directories.begin(), active_directories.end(), canonical_dir) != active_directories.end()) {
        stats.cycles_skipped++;
        stats.warnings.push_back("directory cycle at " + display);
        LOG_WARNING("FileCollector", "Skipping directory cycle", display);
        return;
    }

    std::vector<fs::directory_entry> entries;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        stats.unreadable_directories++;
        stats.warnings.push_back("cannot read directory " + display + ": " + ec.message());
        LOG_WARNING("FileCollector", "Cannot read directory", display + ": " + ec.message());
        return;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        entries.push_back(*it);
    }
    if (ec) {
        stats.unreadable_directories++;
        stats.warnings.push_back("incomplete listing of " + display + ": " + ec.message());
        LOG_WARNING("FileCollector", "Directory listing interrupted", display + ": " + ec.message());
    }

    stats.directories_visited++;
    active_directories.push_back(canonical_dir);

    if (matcher.gitignoreEnabled()) {
        loadGitignore(directory, relative, matcher, stats);
    }

    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename().string() < b.path().filename().string();
              });

    for (const auto& entry : entries) {
        std::vector<std::string> child_relative = relative;
        child_relative.push_back(entry.path().filename().string());
        std::string child_display = joinPath(child_relative);

        std::error_code entry_ec;
        bool is_symlink = entry.is_symlink(entry_ec);
        fs::file_status target_status = fs::status(entry.path(), entry_ec);
        if (entry_ec) {
            // Broken link, or a target we may not stat
            if (matcher.isExcluded(child_relative, false)) {
                stats.excluded_paths++;
                continue;
            }
            result.records.emplace_back(child_relative, 0, FileStatus::SkippedUnreadable);
            stats.warnings.push_back("cannot stat " + child_display + ": " + entry_ec.message());
            LOG_WARNING("FileCollector", "Cannot stat path", child_display + ": " + entry_ec.message());
            continue;
        }

        bool is_directory = fs::is_directory(target_status);
        bool is_regular = fs::is_regular_file(target_status);
        if (!is_directory && !is_regular) {
            LOG_DEBUG("FileCollector", "Skipping special file: " + child_display);
            continue;
        }

        if (matcher.isExcluded(child_relative, is_directory)) {
            stats.excluded_paths++;
            LOG_DEBUG("FileCollector", "Excluded: " + child_display);
            continue;
        }

        if (is_symlink) {
            fs::path target = fs::canonical(entry.path(), entry_ec);
            if (entry_ec || !isWithin(target, canonical_root)) {
                stats.symlinks_outside_root++;
                LOG_DEBUG("FileCollector", "Symlink leaves the scan root: " + child_display);
                if (is_regular) {
                    result.records.emplace_back(child_relative, 0, FileStatus::SkippedExcluded);
                }
                continue;
            }
        }

        if (is_directory) {
            walkDirectory(entry.path(), child_relative, canonical_root, matcher, active_directories, result);
        } else {
            stats.files_seen++;
            result.records.push_back(collectFile(entry.path(), std::move(child_relative), stats));
        }
    }

    active_directories.pop_back();
}

FileRecord FileCollector::collectFile(const fs::path& file_path,
                                      std::vector<std::string> relative,
                                      CollectionStats& stats) const {
    std::string file_name = file_path.filename().string();
    std::string display = joinPath(relative);

    std::error_code ec;
    std::uint64_t file_size = fs::file_size(file_path, ec);
    if (ec) {
        stats.warnings.push_back("cannot stat " + display + ": " + ec.message());
        LOG_WARNING("FileCollector", "Cannot stat file", display + ": " + ec.message());
        return FileRecord(std::move(relative), 0, FileStatus::SkippedUnreadable);
    }

    if (m_max_file_size && file_size > *m_max_file_size) {
        LOG_DEBUG("FileCollector", "Skipping large file: " + display + " (" + std::to_string(file_size) + " bytes)");
        return FileRecord(std::move(relative), file_size, FileStatus::SkippedTooLarge);
    }

    if (hasBinaryExtension(file_name)) {
        return FileRecord(std::move(relative), file_size, FileStatus::SkippedBinary);
    }

    std::string bytes;
    if (!readFile(file_path, bytes)) {
        stats.warnings.push_back("cannot read " + display);
        LOG_WARNING("FileCollector", "Cannot read file", display);
        return FileRecord(std::move(relative), file_size, FileStatus::SkippedUnreadable);
    }

    if (looksBinary(file_name, bytes.substr(0, kSniffSize), m_binary_strict)) {
        return FileRecord(std::move(relative), bytes.size(), FileStatus::SkippedBinary);
    }

    DecodedText decoded = m_codec.decode(bytes);
    if (decoded.lossy) {
        LOG_DEBUG("FileCollector", "Replaced undecodable bytes in " + display);
    }

    FileRecord record(std::move(relative), bytes.size(), FileStatus::Included);
    record.content = std::move(decoded.text);
    record.lossy_decoded = decoded.lossy;
    record.token_count = m_estimator.estimate(record.content);
    record.original_tokens = record.token_count;
    stats.bytes_loaded += record.content.size();
    return record;
}

void FileCollector::loadGitignore(const fs::path& directory,
                                  const std::vector<std::string>& relative,
                                  PathMatcher& matcher,
                                  CollectionStats& stats) const {
    fs::path gitignore_path = directory / ".gitignore";
    std::error_code ec;
    if (!fs::is_regular_file(gitignore_path, ec)) {
        return;
    }

    std::string text;
    if (!readFile(gitignore_path, text)) {
        LOG_WARNING("FileCollector", "Cannot read .gitignore", gitignore_path.string());
        return;
    }

    size_t rules = matcher.addGitignoreRules(text, relative);
    stats.gitignore_files++;
    LOG_DEBUG("FileCollector", "Loaded " + std::to_string(rules) + " rules from " +
              (relative.empty() ? std::string(".gitignore") : joinPath(relative) + "/.gitignore"));
}

bool FileCollector::readFile(const fs::path& file_path, std::string& bytes) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    std::ostringstream content_stream;
    content_stream << file.rdbuf();
    if (file.bad()) {
        return false;
    }
    bytes = content_stream.str();
    return true;
}

bool FileCollector::isWithin(const fs::path& path, const fs::path& root) {
    auto mismatch = std::mismatch(root.begin(), root.end(), path.begin(), path.end());
    return mismatch.first == root.end();
}

bool FileCollector::looksBinary(const std::string& file_name, const std::string& sample, bool strict) {
    if (hasBinaryExtension(file_name)) {
        return true;
    }

    if (!strict) {
        if (hasTextExtension(file_name)) {
            return false;
        }
        return sample.find('\0') != std::string::npos;
    }

    if (sample.find('\0') != std::string::npos) {
        return true;
    }
    if (sample.empty()) {
        return false;
    }

    size_t non_text = 0;
    size_t pos = 0;
    while (pos < sample.size()) {
        unsigned char c = static_cast<unsigned char>(sample[pos]);
        if ((c >= 32 && c <= 126) || c == '\t' || c == '\n' || c == '\r') {
            ++pos;
            continue;
        }
        if (c >= 0x80) {
            size_t length = TextCodec::utf8SequenceLength(sample, pos);
            if (length > 0) {
                pos += length;
                continue;
            }
            // A multi-byte character cut off by the sample window is still text
            if (sample.size() - pos < 4 && (c & 0xC0) == 0xC0) {
                break;
            }
        }
        non_text++;
        ++pos;
    }

    // More than 30% control or invalid bytes marks the file binary
    return static_cast<double>(non_text) / sample.size() > 0.30;
}

bool FileCollector::hasBinaryExtension(const std::string& file_name) {
    static const std::unordered_set<std::string> binary_extensions = {
        ".png", ".jpg", ".jpeg", ".gif", ".bmp", ".ico", ".webp", ".tif", ".tiff", ".psd",
        ".mp3", ".wav", ".flac", ".ogg", ".mp4", ".mkv", ".avi", ".mov", ".webm",
        ".zip", ".gz", ".tgz", ".bz2", ".xz", ".7z", ".rar", ".tar", ".zst",
        ".pdf", ".doc", ".docx", ".xls", ".xlsx", ".ppt", ".pptx", ".odt",
        ".o", ".obj", ".a", ".lib", ".so", ".dll", ".dylib", ".exe", ".bin",
        ".class", ".jar", ".pyc", ".pyo", ".wasm",
        ".ttf", ".otf", ".woff", ".woff2", ".eot",
        ".sqlite", ".db", ".iso", ".dmg"
    };
    return binary_extensions.count(lowercaseExtension(file_name)) > 0;
}

bool FileCollector::hasTextExtension(const std::string& file_name) {
    static const std::unordered_set<std::string> text_extensions = {
        ".cpp", ".hpp", ".h", ".c", ".cc", ".cxx", ".hxx", ".ipp", ".inl",
        ".py", ".pyx", ".pyi",
        ".js", ".jsx", ".ts", ".tsx", ".mjs", ".cjs",
        ".java", ".scala", ".kt", ".swift", ".cs",
        ".rs", ".go", ".rb", ".php", ".pl", ".lua",
        ".md", ".txt", ".rst", ".adoc",
        ".yml", ".yaml", ".json", ".toml", ".ini", ".cfg", ".conf",
        ".xml", ".html", ".htm", ".css", ".scss", ".sass", ".svg",
        ".sh", ".bash", ".zsh", ".fish", ".ps1", ".bat",
        ".sql", ".cmake", ".make", ".mk", ".proto", ".graphql",
        ".dockerfile", ".csv", ".tsv", ".log"
    };
    static const std::unordered_set<std::string> text_names = {
        "Makefile", "CMakeLists.txt", "Dockerfile", "LICENSE", "README", "Jenkinsfile",
        ".gitignore", ".gitattributes", ".dockerignore", ".editorconfig", ".env"
    };
    return text_extensions.count(lowercaseExtension(file_name)) > 0 ||
           text_names.count(file_name) > 0;
}

} // namespace Repodump
