// =================================================================
// src/Repodump/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Repodump/CliParser.hpp"

namespace Repodump {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("repodump: flatten a source tree into one text dump for language models.", "repodump");
    m_app->set_version_flag("--version", kVersion);

    m_app->add_option("path", m_commands.path, "Directory to dump.")->required();

    setupFilterOptions(*m_app);
    setupTreeOptions(*m_app);
    setupOutputOptions(*m_app);

    m_app->add_option("--config", m_commands.config_path, "YAML config file (default: <path>/.repodump.yml if present).");
    m_app->add_option("--log-dir", m_commands.log_dir, "Also write rotating log files to this directory.");
    auto* verbose = m_app->add_flag("-v,--verbose", m_commands.verbose, "Log debug messages.");
    auto* quiet = m_app->add_flag("-q,--quiet", m_commands.quiet, "Log errors only.");
    quiet->excludes(verbose);

    m_app->callback([this]() { collectOptionalValues(); });

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupFilterOptions(CLI::App& app) {
    app.add_option("--include", m_commands.include_globs, "Include only files matching this glob (repeatable).")
        ->allow_extra_args(false);
    app.add_option("--exclude", m_commands.exclude_globs, "Exclude paths matching this glob (repeatable).")
        ->allow_extra_args(false);
    m_max_size_opt = app.add_option("--max-size", m_max_size, "Skip files larger than this many bytes (default: 1048576).");
    m_max_tokens_opt = app.add_option("--max-tokens", m_max_tokens, "Hard token cap; the largest files are truncated first.");
    m_encoding_opt = app.add_option("--encoding", m_encoding, "Text encoding: utf-8, latin-1 or ascii (default: utf-8).");
    addSwitch(app, "--binary-strict", "--no-binary-strict", "content sniffing for binary files", m_commands.binary_strict);
    addSwitch(app, "--gitignore", "--no-gitignore", "respecting .gitignore files", m_commands.gitignore);
}

void CliParser::setupTreeOptions(CLI::App& app) {
    addSwitch(app, "--tree", "--no-tree", "the directory tree", m_commands.show_tree);
    m_tree_depth_opt = app.add_option("--tree-depth", m_tree_depth, "Deepest tree level shown (root is 0).");
    addSwitch(app, "--tree-tokens", "--no-tree-tokens", "token counts in the tree", m_commands.tree_tokens);
    addSwitch(app, "--tree-size", "--no-tree-size", "sizes in the tree", m_commands.tree_size);
    m_tree_sort_opt = app.add_option("--tree-sort", m_tree_sort, "Sibling order: name, size or tokens (default: name).");

    auto* dirs_first = app.add_flag("--tree-dirs-first", "List directories before files (default).");
    auto* files_first = app.add_flag("--tree-files-first", "List files before directories.");
    files_first->excludes(dirs_first);
    m_switches.push_back({dirs_first, files_first, &m_commands.tree_dirs_first});
}

void CliParser::setupOutputOptions(CLI::App& app) {
    m_format_opt = app.add_option("--format", m_format, "Output format: text, json or html (default: text).");
    addSwitch(app, "--stdout", "--no-stdout", "printing the dump to stdout", m_commands.write_stdout);
    app.add_option("--outfile", m_commands.outfile, "Also write the dump to this file.");
}

void CliParser::addSwitch(CLI::App& app, const std::string& on_name, const std::string& off_name,
                          const std::string& description, std::optional<bool>& target) {
    auto* on = app.add_flag(on_name, "Enable " + description + ".");
    auto* off = app.add_flag(off_name, "Disable " + description + ".");
    off->excludes(on);
    m_switches.push_back({on, off, &target});
}

void CliParser::collectOptionalValues() {
    for (const auto& sw : m_switches) {
        if (sw.on->count() > 0) {
            *sw.target = true;
        } else if (sw.off->count() > 0) {
            *sw.target = false;
        }
    }

    if (m_max_size_opt->count() > 0) {
        m_commands.max_size = m_max_size;
    }
    if (m_max_tokens_opt->count() > 0) {
        m_commands.max_tokens = m_max_tokens;
    }
    if (m_tree_depth_opt->count() > 0) {
        m_commands.tree_depth = m_tree_depth;
    }
    if (m_format_opt->count() > 0) {
        m_commands.format = m_format;
    }
    if (m_encoding_opt->count() > 0) {
        m_commands.encoding = m_encoding;
    }
    if (m_tree_sort_opt->count() > 0) {
        m_commands.tree_sort = m_tree_sort;
    }
}

} // namespace Repodump
