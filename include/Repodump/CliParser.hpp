// =================================================================
// include/Repodump/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Repodump {

constexpr const char* kVersion = "0.3.0";

// Parsed command line. Optional fields are set only when the option was
// given, so that they override the config file and nothing else does.
struct Commands {
    std::string path;

    std::vector<std::string> include_globs;
    std::vector<std::string> exclude_globs;
    std::optional<long long> max_size;
    std::optional<long long> max_tokens;
    std::optional<std::string> format;
    std::optional<bool> binary_strict;
    std::optional<bool> gitignore;
    std::optional<std::string> encoding;

    // Tree options
    std::optional<bool> show_tree;
    std::optional<long long> tree_depth;
    std::optional<bool> tree_tokens;
    std::optional<bool> tree_size;
    std::optional<std::string> tree_sort;
    std::optional<bool> tree_dirs_first;

    // Output
    std::optional<bool> write_stdout;
    std::string outfile;

    // Process
    std::string config_path;
    std::string log_dir;
    bool verbose = false;
    bool quiet = false;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all options and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    // An --x / --no-x pair feeding one optional<bool>
    struct Switch {
        CLI::Option* on = nullptr;
        CLI::Option* off = nullptr;
        std::optional<bool>* target = nullptr;
    };

    void setupFilterOptions(CLI::App& app);
    void setupTreeOptions(CLI::App& app);
    void setupOutputOptions(CLI::App& app);
    void addSwitch(CLI::App& app, const std::string& on_name, const std::string& off_name,
                   const std::string& description, std::optional<bool>& target);
    void collectOptionalValues();

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
    std::vector<Switch> m_switches;

    // Raw storage for valued options; copied into m_commands only if given
    long long m_max_size = 0;
    long long m_max_tokens = 0;
    long long m_tree_depth = 0;
    std::string m_format;
    std::string m_encoding;
    std::string m_tree_sort;
    CLI::Option* m_max_size_opt = nullptr;
    CLI::Option* m_max_tokens_opt = nullptr;
    CLI::Option* m_tree_depth_opt = nullptr;
    CLI::Option* m_format_opt = nullptr;
    CLI::Option* m_encoding_opt = nullptr;
    CLI::Option* m_tree_sort_opt = nullptr;
};

} // namespace Repodump
