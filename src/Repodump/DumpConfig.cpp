// =================================================================
// src/Repodump/DumpConfig.cpp
// =================================================================
// Implementation for dump configuration management.

#include "Repodump/DumpConfig.hpp"
#include "Repodump/CliParser.hpp"
#include "Repodump/Errors.hpp"
#include "Repodump/Logger.hpp"
#include "Repodump/PathMatcher.hpp"
#include "Repodump/TextCodec.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>

namespace Repodump {

namespace {

std::uint64_t positiveValue(long long value, const std::string& name) {
    if (value <= 0) {
        throw ConfigError(name + " must be greater than 0 (got " + std::to_string(value) + ")");
    }
    return static_cast<std::uint64_t>(value);
}

size_t depthValue(long long value) {
    if (value < 0) {
        throw ConfigError("tree depth cannot be negative (got " + std::to_string(value) + ")");
    }
    return static_cast<size_t>(value);
}

void appendStrings(const YAML::Node& node, std::vector<std::string>& target) {
    if (node.IsScalar()) {
        target.push_back(node.as<std::string>());
    } else if (node.IsSequence()) {
        for (const auto& item : node) {
            target.push_back(item.as<std::string>());
        }
    } else if (!node.IsNull()) {
        throw ConfigError("expected a string or a list of strings");
    }
}

// A null value (max_tokens: ~) clears the limit
std::optional<std::uint64_t> limitValue(const YAML::Node& node, const std::string& name) {
    if (node.IsNull()) {
        return std::nullopt;
    }
    return positiveValue(node.as<long long>(), name);
}

} // anonymous namespace

void DumpConfig::loadFromYaml(const std::string& config_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("cannot parse " + config_path + ": " + e.what());
    }

    if (root.IsNull()) {
        return;
    }
    if (!root.IsMap()) {
        throw ConfigError(config_path + ": top level must be a mapping");
    }

    std::string key;
    try {
        key = "include";
        if (root[key]) appendStrings(root[key], include_globs);
        key = "exclude";
        if (root[key]) appendStrings(root[key], exclude_globs);
        key = "max_size";
        if (root[key]) max_size_bytes = limitValue(root[key], key);
        key = "max_tokens";
        if (root[key]) max_tokens = limitValue(root[key], key);
        key = "binary_strict";
        if (root[key]) binary_strict = root[key].as<bool>();
        key = "gitignore";
        if (root[key]) use_gitignore = root[key].as<bool>();
        key = "encoding";
        if (root[key]) encoding = root[key].as<std::string>();
        key = "format";
        if (root[key]) format = parseOutputFormat(root[key].as<std::string>());
        key = "stdout";
        if (root[key]) write_stdout = root[key].as<bool>();
        key = "outfile";
        if (root[key]) outfile = root[key].as<std::string>();

        YAML::Node tree = root["tree"];
        if (tree) {
            key = "tree.show";
            if (tree["show"]) show_tree = tree["show"].as<bool>();
            key = "tree.depth";
            if (tree["depth"]) {
                if (tree["depth"].IsNull()) {
                    tree_depth.reset();
                } else {
                    tree_depth = depthValue(tree["depth"].as<long long>());
                }
            }
            key = "tree.tokens";
            if (tree["tokens"]) tree_show_tokens = tree["tokens"].as<bool>();
            key = "tree.size";
            if (tree["size"]) tree_show_size = tree["size"].as<bool>();
            key = "tree.sort";
            if (tree["sort"]) tree_sort = parseSortKey(tree["sort"].as<std::string>());
            key = "tree.dirs_first";
            if (tree["dirs_first"]) tree_dirs_first = tree["dirs_first"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(config_path + ": invalid value for '" + key + "': " + e.what());
    } catch (const ConfigError& e) {
        throw ConfigError(config_path + ": '" + key + "': " + e.what());
    }

    LOG_DEBUG("DumpConfig", "Loaded configuration from " + config_path);
}

void DumpConfig::applyCommandOverrides(const Commands& commands) {
    if (!commands.path.empty()) {
        root_path = commands.path;
    }

    include_globs.insert(include_globs.end(), commands.include_globs.begin(), commands.include_globs.end());
    exclude_globs.insert(exclude_globs.end(), commands.exclude_globs.begin(), commands.exclude_globs.end());

    if (commands.max_size) {
        max_size_bytes = positiveValue(*commands.max_size, "--max-size");
    }
    if (commands.max_tokens) {
        max_tokens = positiveValue(*commands.max_tokens, "--max-tokens");
    }
    if (commands.binary_strict) {
        binary_strict = *commands.binary_strict;
    }
    if (commands.gitignore) {
        use_gitignore = *commands.gitignore;
    }
    if (commands.encoding) {
        encoding = *commands.encoding;
    }
    if (commands.format) {
        format = parseOutputFormat(*commands.format);
    }

    if (commands.show_tree) {
        show_tree = *commands.show_tree;
    }
    if (commands.tree_depth) {
        tree_depth = depthValue(*commands.tree_depth);
    }
    if (commands.tree_tokens) {
        tree_show_tokens = *commands.tree_tokens;
    }
    if (commands.tree_size) {
        tree_show_size = *commands.tree_size;
    }
    if (commands.tree_sort) {
        tree_sort = parseSortKey(*commands.tree_sort);
    }
    if (commands.tree_dirs_first) {
        tree_dirs_first = *commands.tree_dirs_first;
    }

    if (commands.write_stdout) {
        write_stdout = *commands.write_stdout;
    }
    if (!commands.outfile.empty()) {
        outfile = commands.outfile;
    }
}

void DumpConfig::validate() const {
    if (root_path.empty()) {
        throw ConfigError("no root directory given");
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(root_path, ec)) {
        throw ConfigError("root is not a readable directory: " + root_path);
    }

    if (max_size_bytes && *max_size_bytes == 0) {
        throw ConfigError("max_size must be greater than 0");
    }
    if (max_tokens && *max_tokens == 0) {
        throw ConfigError("max_tokens must be greater than 0");
    }

    TextCodec::parseEncoding(encoding);

    // Compiles every glob and rejects include/exclude overlaps
    PathMatcher::create(include_globs, exclude_globs, use_gitignore);
}

Budget DumpConfig::budget() const {
    Budget budget;
    budget.max_size_bytes = max_size_bytes;
    budget.max_tokens = max_tokens;
    return budget;
}

TreeOptions DumpConfig::treeOptions() const {
    TreeOptions options;
    options.depth_limit = tree_depth;
    options.sort_key = tree_sort;
    options.dirs_first = tree_dirs_first;
    return options;
}

RenderOptions DumpConfig::renderOptions() const {
    RenderOptions options;
    options.show_tree = show_tree;
    options.show_tokens = tree_show_tokens;
    options.show_size = tree_show_size;
    return options;
}

std::string DumpConfig::defaultConfigPath(const std::string& root_path) {
    return (std::filesystem::path(root_path) / kDefaultConfigName).string();
}

} // namespace Repodump
