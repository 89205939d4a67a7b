// =================================================================
// include/Repodump/Renderer.hpp
// =================================================================
// Header for turning a finished dump into text, JSON or HTML.

#pragma once

#include "FileRecord.hpp"
#include "Summary.hpp"
#include "TreeAggregator.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace Repodump {

enum class OutputFormat {
    Text,
    Json,
    Html
};

/**
 * @brief Parse "text", "json" or "html" (case-insensitive)
 * @throws ConfigError for any other value
 */
OutputFormat parseOutputFormat(const std::string& value);

std::string outputFormatName(OutputFormat format);

/**
 * @brief What the rendered tree shows
 */
struct RenderOptions {
    bool show_tree = true;
    bool show_tokens = true;
    bool show_size = false;
};

/**
 * @brief Base class for output formats
 */
class Renderer {
public:
    explicit Renderer(const RenderOptions& options);
    virtual ~Renderer() = default;

    /**
     * @brief Render a dump
     * @param root_name Display name of the scan root
     * @param tree Tree built over the final records
     * @param records Final records in walk order
     * @param summary Totals for the dump
     * @return Complete document
     */
    virtual std::string render(const std::string& root_name,
                               const DirectoryTree& tree,
                               const std::vector<FileRecord>& records,
                               const ScanSummary& summary) const = 0;

    /**
     * @brief Create the renderer for a format
     */
    static std::unique_ptr<Renderer> create(OutputFormat format, const RenderOptions& options);

    /// Bytes with a K/M/G suffix (1024 base), e.g. "1.5K"
    static std::string formatSize(std::uint64_t size);

    /// Tokens with a K/M/B suffix (1000 base), e.g. "12.3K"
    static std::string formatTokens(std::uint64_t tokens);

    const RenderOptions& options() const { return m_options; }

protected:
    RenderOptions m_options;

    /**
     * @brief Box-drawing lines for the tree, root first
     */
    std::vector<std::string> renderTreeLines(const std::string& root_name, const DirectoryTree& tree) const;

    /**
     * @brief Footer line such as "3 directories, 12 files"
     */
    static std::string treeFooter(const DirectoryTree& tree);

    /**
     * @brief Short note for files that are not in the dump verbatim
     * @return e.g. "truncated" or "binary"; empty for Included
     */
    static std::string statusNote(FileStatus status);

private:
    void renderTreeEntries(const DirectoryTree& tree,
                           const DirectoryNode& node,
                           const std::string& prefix,
                           std::vector<std::string>& lines) const;
    std::string describeEntry(const TreeEntry& entry) const;
};

/**
 * @brief Plain text: summary header, tree, then one delimited block per file
 */
class TextRenderer : public Renderer {
public:
    /// Rule above and below each file header
    static const std::string kSeparator;

    using Renderer::Renderer;

    std::string render(const std::string& root_name,
                       const DirectoryTree& tree,
                       const std::vector<FileRecord>& records,
                       const ScanSummary& summary) const override;
};

/**
 * @brief JSON document with root, summary, tree and files
 */
class JsonRenderer : public Renderer {
public:
    using Renderer::Renderer;

    std::string render(const std::string& root_name,
                       const DirectoryTree& tree,
                       const std::vector<FileRecord>& records,
                       const ScanSummary& summary) const override;
};

/**
 * @brief Standalone HTML page
 */
class HtmlRenderer : public Renderer {
public:
    using Renderer::Renderer;

    std::string render(const std::string& root_name,
                       const DirectoryTree& tree,
                       const std::vector<FileRecord>& records,
                       const ScanSummary& summary) const override;

    /**
     * @brief Escape &, <, >, " and ' for HTML text and attributes
     */
    static std::string escape(const std::string& text);
};

} // namespace Repodump
