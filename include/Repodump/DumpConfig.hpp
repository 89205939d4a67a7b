// =================================================================
// include/Repodump/DumpConfig.hpp
// =================================================================
// Configuration structure for one dump run.

#pragma once

#include "FileRecord.hpp"
#include "Renderer.hpp"
#include "TreeAggregator.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Repodump {

struct Commands;

/**
 * @brief Settings for one dump, built from defaults, an optional YAML file
 *        and the command line, in that order of precedence
 */
struct DumpConfig {
    static constexpr std::uint64_t kDefaultMaxFileSize = 1024 * 1024;
    static constexpr const char* kDefaultConfigName = ".repodump.yml";

    std::string root_path;

    // Selection
    std::vector<std::string> include_globs;
    std::vector<std::string> exclude_globs;
    std::optional<std::uint64_t> max_size_bytes = kDefaultMaxFileSize;
    std::optional<std::uint64_t> max_tokens;
    bool binary_strict = true;
    bool use_gitignore = true;
    std::string encoding = "utf-8";

    // Tree
    bool show_tree = true;
    std::optional<size_t> tree_depth;
    bool tree_show_tokens = true;
    bool tree_show_size = false;
    SortKey tree_sort = SortKey::Name;
    bool tree_dirs_first = true;

    // Output
    OutputFormat format = OutputFormat::Text;
    bool write_stdout = true;
    std::string outfile;

    /**
     * @brief Load settings from a YAML file
     *
     * Keys absent from the file keep their current values. include and
     * exclude accept a list or a single string and are appended.
     *
     * @param config_path Path to the YAML file
     * @throws ConfigError if the file cannot be parsed or a value is invalid
     */
    void loadFromYaml(const std::string& config_path);

    /**
     * @brief Apply command-line overrides
     * @param commands Command-line arguments; only given options apply
     * @throws ConfigError for invalid values
     */
    void applyCommandOverrides(const Commands& commands);

    /**
     * @brief Validate configuration settings
     *
     * Checks the root directory, globs, budgets and encoding.
     *
     * @throws ConfigError describing the first problem found
     */
    void validate() const;

    Budget budget() const;
    TreeOptions treeOptions() const;
    RenderOptions renderOptions() const;

    /**
     * @brief Config file looked for when --config is not given
     */
    static std::string defaultConfigPath(const std::string& root_path);
};

} // namespace Repodump
