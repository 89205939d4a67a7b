// =================================================================
// src/Repodump/Renderer.cpp
// =================================================================
// Implementation for the text, JSON and HTML renderers.

#include "Repodump/Renderer.hpp"
#include "Repodump/Errors.hpp"
#include "nlohmann/json.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace Repodump {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string scaled(double value, const char* suffix) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << suffix;
    return oss.str();
}

std::string padLeft(const std::string& text, size_t width) {
    if (text.size() >= width) {
        return text;
    }
    return std::string(width - text.size(), ' ') + text;
}

std::string tokenLine(const ScanSummary& summary) {
    std::string line = "Tokens: " + std::to_string(summary.total_tokens);
    if (summary.max_tokens) {
        line += " (cap " + std::to_string(*summary.max_tokens) + ", " +
                std::to_string(summary.tokens_before_budget) + " before truncation)";
    }
    return line;
}

std::string fileLine(const ScanSummary& summary) {
    std::ostringstream line;
    line << "Files: " << summary.included_files << " included, "
         << summary.truncated_files << " truncated, "
         << summary.dropped_files << " dropped";
    return line.str();
}

std::string skipLine(const ScanSummary& summary) {
    std::ostringstream line;
    line << "Skipped: " << summary.skipped_too_large << " too large, "
         << summary.skipped_binary << " binary, "
         << summary.skipped_excluded << " outside root, "
         << summary.skipped_unreadable << " unreadable, "
         << summary.excluded_paths << " paths filtered";
    return line.str();
}

nlohmann::json summaryToJson(const ScanSummary& summary) {
    nlohmann::json json = {
        {"included_files", summary.included_files},
        {"truncated_files", summary.truncated_files},
        {"dropped_files", summary.dropped_files},
        {"skipped_too_large", summary.skipped_too_large},
        {"skipped_binary", summary.skipped_binary},
        {"skipped_excluded", summary.skipped_excluded},
        {"skipped_unreadable", summary.skipped_unreadable},
        {"excluded_paths", summary.excluded_paths},
        {"directories", summary.directories},
        {"lossy_files", summary.lossy_files},
        {"total_tokens", summary.total_tokens},
        {"tokens_before_budget", summary.tokens_before_budget},
        {"total_bytes", summary.total_bytes},
        {"budget_infeasible", summary.budget_infeasible},
        {"warnings", summary.warnings}
    };
    if (summary.max_tokens) {
        json["max_tokens"] = *summary.max_tokens;
    } else {
        json["max_tokens"] = nullptr;
    }
    return json;
}

nlohmann::json nodeToJson(const DirectoryTree& tree, const DirectoryNode& node) {
    nlohmann::json json = {
        {"name", node.name},
        {"type", "directory"},
        {"tokens", node.aggregate_tokens},
        {"size", node.aggregate_size},
        {"children", nlohmann::json::array()}
    };
    if (tree.isCollapsed(node) && !node.children.empty()) {
        json["collapsed"] = true;
    }
    for (const TreeEntry* entry : tree.visibleChildren(node)) {
        if (entry->isDirectory()) {
            json["children"].push_back(nodeToJson(tree, *entry->directory));
        } else {
            json["children"].push_back({
                {"name", entry->name},
                {"type", "file"},
                {"tokens", entry->file->token_count},
                {"size", entry->file->size_bytes},
                {"status", statusName(entry->file->status())}
            });
        }
    }
    return json;
}

} // anonymous namespace

OutputFormat parseOutputFormat(const std::string& value) {
    std::string name = lowercase(value);
    if (name == "text" || name == "txt") {
        return OutputFormat::Text;
    }
    if (name == "json") {
        return OutputFormat::Json;
    }
    if (name == "html") {
        return OutputFormat::Html;
    }
    throw ConfigError("unknown output format '" + value + "' (expected text, json or html)");
}

std::string outputFormatName(OutputFormat format) {
    switch (format) {
        case OutputFormat::Text: return "text";
        case OutputFormat::Json: return "json";
        case OutputFormat::Html: return "html";
        default: return "unknown";
    }
}

Renderer::Renderer(const RenderOptions& options) : m_options(options) {}

std::unique_ptr<Renderer> Renderer::create(OutputFormat format, const RenderOptions& options) {
    switch (format) {
        case OutputFormat::Json:
            return std::make_unique<JsonRenderer>(options);
        case OutputFormat::Html:
            return std::make_unique<HtmlRenderer>(options);
        case OutputFormat::Text:
        default:
            return std::make_unique<TextRenderer>(options);
    }
}

std::string Renderer::formatSize(std::uint64_t size) {
    const double kib = 1024.0;
    if (size < 1024) {
        return std::to_string(size);
    } else if (size < 1024ULL * 1024) {
        return scaled(size / kib, "K");
    } else if (size < 1024ULL * 1024 * 1024) {
        return scaled(size / (kib * kib), "M");
    }
    return scaled(size / (kib * kib * kib), "G");
}

std::string Renderer::formatTokens(std::uint64_t tokens) {
    if (tokens < 1000) {
        return std::to_string(tokens);
    } else if (tokens < 1000ULL * 1000) {
        return scaled(tokens / 1000.0, "K");
    } else if (tokens < 1000ULL * 1000 * 1000) {
        return scaled(tokens / 1e6, "M");
    }
    return scaled(tokens / 1e9, "B");
}

std::string Renderer::statusNote(FileStatus status) {
    switch (status) {
        case FileStatus::Truncated: return "truncated";
        case FileStatus::Dropped: return "dropped";
        case FileStatus::SkippedTooLarge: return "too large";
        case FileStatus::SkippedBinary: return "binary";
        case FileStatus::SkippedExcluded: return "outside root";
        case FileStatus::SkippedUnreadable: return "unreadable";
        case FileStatus::Included:
        default: return "";
    }
}

std::vector<std::string> Renderer::renderTreeLines(const std::string& root_name, const DirectoryTree& tree) const {
    std::vector<std::string> lines;
    const DirectoryNode& root = tree.root();

    std::string line;
    if (m_options.show_size) {
        line += "[" + padLeft(formatSize(root.aggregate_size), 10) + "] ";
    }
    line += root_name + "/";
    if (m_options.show_tokens) {
        line += " (" + formatTokens(root.aggregate_tokens) + " tok)";
    }
    lines.push_back(line);

    renderTreeEntries(tree, root, "", lines);
    return lines;
}

void Renderer::renderTreeEntries(const DirectoryTree& tree,
                                 const DirectoryNode& node,
                                 const std::string& prefix,
                                 std::vector<std::string>& lines) const {
    std::vector<const TreeEntry*> children = tree.visibleChildren(node);
    for (size_t i = 0; i < children.size(); ++i) {
        const TreeEntry& entry = *children[i];
        bool is_last = (i + 1 == children.size());

        lines.push_back(prefix + (is_last ? "└── " : "├── ") + describeEntry(entry));

        if (entry.isDirectory()) {
            renderTreeEntries(tree, *entry.directory, prefix + (is_last ? "    " : "│   "), lines);
        }
    }
}

std::string Renderer::describeEntry(const TreeEntry& entry) const {
    std::string line;
    if (m_options.show_size) {
        line += "[" + padLeft(formatSize(entry.size()), 10) + "] ";
    }
    line += entry.name;
    if (entry.isDirectory()) {
        line += "/";
    }
    if (m_options.show_tokens) {
        line += " (" + formatTokens(entry.tokens()) + " tok)";
    }
    if (!entry.isDirectory()) {
        std::string note = statusNote(entry.file->status());
        if (!note.empty()) {
            line += " [" + note + "]";
        }
    }
    return line;
}

std::string Renderer::treeFooter(const DirectoryTree& tree) {
    return std::to_string(tree.visibleDirectoryCount()) + " directories, " +
           std::to_string(tree.visibleFileCount()) + " files";
}

// --- TextRenderer ---

const std::string TextRenderer::kSeparator(48, '=');

std::string TextRenderer::render(const std::string& root_name,
                                 const DirectoryTree& tree,
                                 const std::vector<FileRecord>& records,
                                 const ScanSummary& summary) const {
    std::ostringstream out;

    out << "Repository: " << root_name << "\n";
    out << fileLine(summary) << "\n";
    out << skipLine(summary) << "\n";
    out << tokenLine(summary) << "\n";
    out << "Size: " << formatSize(summary.total_bytes) << "\n";
    for (const auto& warning : summary.warnings) {
        out << "Warning: " << warning << "\n";
    }

    if (m_options.show_tree) {
        out << "\nDirectory structure:\n";
        for (const auto& line : renderTreeLines(root_name, tree)) {
            out << line << "\n";
        }
        out << "\n" << treeFooter(tree) << "\n";
    }

    for (const auto& record : records) {
        if (!carriesContent(record.status())) {
            continue;
        }
        out << "\n" << kSeparator << "\n";
        out << "FILE: " << record.pathString();
        if (record.status() == FileStatus::Truncated) {
            out << " (truncated from " << record.original_tokens << " tokens)";
        }
        out << "\n" << kSeparator << "\n";
        out << record.content;
        if (!record.content.empty() && record.content.back() != '\n') {
            out << "\n";
        }
    }

    return out.str();
}

// --- JsonRenderer ---

std::string JsonRenderer::render(const std::string& root_name,
                                 const DirectoryTree& tree,
                                 const std::vector<FileRecord>& records,
                                 const ScanSummary& summary) const {
    nlohmann::json document;
    document["root"] = root_name;
    document["summary"] = summaryToJson(summary);

    if (m_options.show_tree) {
        nlohmann::json tree_json = nodeToJson(tree, tree.root());
        tree_json["name"] = root_name;
        document["tree"] = tree_json;
    } else {
        document["tree"] = nullptr;
    }

    document["files"] = nlohmann::json::array();
    for (const auto& record : records) {
        nlohmann::json file = {
            {"path", record.pathString()},
            {"status", statusName(record.status())},
            {"size", record.size_bytes},
            {"tokens", record.token_count},
            {"original_tokens", record.original_tokens},
            {"lossy", record.lossy_decoded}
        };
        if (carriesContent(record.status())) {
            file["content"] = record.content;
        } else {
            file["content"] = nullptr;
        }
        document["files"].push_back(file);
    }

    // File names are not guaranteed to be UTF-8
    return document.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

// --- HtmlRenderer ---

std::string HtmlRenderer::escape(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            case '\'': escaped += "&#39;"; break;
            default: escaped += c; break;
        }
    }
    return escaped;
}

std::string HtmlRenderer::render(const std::string& root_name,
                                 const DirectoryTree& tree,
                                 const std::vector<FileRecord>& records,
                                 const ScanSummary& summary) const {
    std::ostringstream out;
    std::string title = escape(root_name);

    out << "<!DOCTYPE html>\n";
    out << "<html lang=\"en\">\n<head>\n";
    out << "<meta charset=\"utf-8\">\n";
    out << "<title>" << title << "</title>\n";
    out << "<style>\n"
        << "body { font-family: sans-serif; margin: 2em; }\n"
        << "pre { background: #f6f8fa; padding: 1em; overflow-x: auto; }\n"
        << ".warning { color: #9a6700; }\n"
        << "</style>\n";
    out << "</head>\n<body>\n";

    out << "<h1>" << title << "</h1>\n";
    out << "<ul class=\"summary\">\n";
    out << "<li>" << escape(fileLine(summary)) << "</li>\n";
    out << "<li>" << escape(skipLine(summary)) << "</li>\n";
    out << "<li>" << escape(tokenLine(summary)) << "</li>\n";
    out << "<li>Size: " << formatSize(summary.total_bytes) << "</li>\n";
    for (const auto& warning : summary.warnings) {
        out << "<li class=\"warning\">Warning: " << escape(warning) << "</li>\n";
    }
    out << "</ul>\n";

    if (m_options.show_tree) {
        out << "<h2>Directory structure</h2>\n<pre class=\"tree\">";
        for (const auto& line : renderTreeLines(root_name, tree)) {
            out << escape(line) << "\n";
        }
        out << "\n" << treeFooter(tree) << "</pre>\n";
    }

    for (const auto& record : records) {
        if (!carriesContent(record.status())) {
            continue;
        }
        std::string path = escape(record.pathString());
        out << "<section class=\"file\" id=\"" << path << "\">\n";
        out << "<h2>" << path;
        if (record.status() == FileStatus::Truncated) {
            out << " <small>(truncated from " << record.original_tokens << " tokens)</small>";
        }
        out << "</h2>\n";
        out << "<pre>" << escape(record.content) << "</pre>\n";
        out << "</section>\n";
    }

    out << "</body>\n</html>\n";
    return out.str();
}

} // namespace Repodump
