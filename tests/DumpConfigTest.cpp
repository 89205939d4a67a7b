// =================================================================
// tests/DumpConfigTest.cpp
// =================================================================
// Unit tests for DumpConfig loading, overrides and validation.

#include "Repodump/DumpConfig.hpp"
#include "Repodump/CliParser.hpp"
#include "Repodump/Errors.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;
using namespace Repodump;

class DumpConfigTest {
private:
    fs::path test_dir;

    std::string writeConfig(const std::string& name, const std::string& yaml) {
        fs::create_directories(test_dir);
        fs::path path = test_dir / name;
        std::ofstream(path) << yaml;
        return path.string();
    }

    template <typename Fn>
    static bool throwsConfigError(Fn fn) {
        try {
            fn();
        } catch (const ConfigError&) {
            return true;
        }
        return false;
    }

    void cleanupTestFiles() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

public:
    DumpConfigTest() : test_dir(fs::temp_directory_path() / "repodump_dump_config_test") {}

    ~DumpConfigTest() { cleanupTestFiles(); }

    void testDefaults() {
        std::cout << "Testing defaults..." << std::endl;

        DumpConfig config;
        assert(config.max_size_bytes && *config.max_size_bytes == 1048576);
        assert(!config.max_tokens);
        assert(config.binary_strict && config.use_gitignore);
        assert(config.format == OutputFormat::Text);
        assert(config.encoding == "utf-8");
        assert(config.show_tree && config.tree_show_tokens && !config.tree_show_size);
        assert(config.tree_sort == SortKey::Name && config.tree_dirs_first);
        assert(config.write_stdout && config.outfile.empty());
        assert(DumpConfig::defaultConfigPath("proj") == (fs::path("proj") / ".repodump.yml").string());

        std::cout << "✓ Defaults test passed" << std::endl;
    }

    void testLoadFromYaml() {
        std::cout << "Testing YAML loading..." << std::endl;

        std::string path = writeConfig("full.yml",
            "include:\n"
            "  - '*.cpp'\n"
            "  - '*.hpp'\n"
            "exclude: build\n"
            "max_size: 2048\n"
            "max_tokens: 500\n"
            "binary_strict: false\n"
            "gitignore: false\n"
            "format: json\n"
            "encoding: latin-1\n"
            "stdout: false\n"
            "outfile: dump.json\n"
            "tree:\n"
            "  show: false\n"
            "  depth: 2\n"
            "  tokens: false\n"
            "  size: true\n"
            "  sort: tokens\n"
            "  dirs_first: false\n");

        DumpConfig config;
        config.loadFromYaml(path);

        assert(config.include_globs.size() == 2 && config.include_globs[1] == "*.hpp");
        assert(config.exclude_globs.size() == 1 && config.exclude_globs[0] == "build");
        assert(*config.max_size_bytes == 2048);
        assert(*config.max_tokens == 500);
        assert(!config.binary_strict && !config.use_gitignore);
        assert(config.format == OutputFormat::Json);
        assert(config.encoding == "latin-1");
        assert(!config.write_stdout && config.outfile == "dump.json");
        assert(!config.show_tree);
        assert(config.tree_depth && *config.tree_depth == 2);
        assert(!config.tree_show_tokens && config.tree_show_size);
        assert(config.tree_sort == SortKey::Tokens);
        assert(!config.tree_dirs_first);

        std::cout << "✓ YAML loading test passed" << std::endl;
    }

    void testPartialAndEmptyYaml() {
        std::cout << "Testing partial and empty YAML..." << std::endl;

        DumpConfig config;
        config.loadFromYaml(writeConfig("empty.yml", ""));
        assert(config.format == OutputFormat::Text && "Empty file changes nothing");

        config.max_tokens = 100;
        config.loadFromYaml(writeConfig("partial.yml", "max_tokens: ~\nformat: html\n"));
        assert(!config.max_tokens && "Null clears the limit");
        assert(config.format == OutputFormat::Html);
        assert(config.use_gitignore && "Absent keys keep their values");

        std::cout << "✓ Partial and empty YAML test passed" << std::endl;
    }

    void testYamlErrors() {
        std::cout << "Testing YAML errors..." << std::endl;

        auto load = [this](const std::string& name, const std::string& yaml) {
            std::string path = writeConfig(name, yaml);
            return [path] {
                DumpConfig config;
                config.loadFromYaml(path);
            };
        };

        assert(throwsConfigError(load("zero.yml", "max_tokens: 0\n")));
        assert(throwsConfigError(load("negative.yml", "max_size: -10\n")));
        assert(throwsConfigError(load("depth.yml", "tree:\n  depth: -1\n")));
        assert(throwsConfigError(load("format.yml", "format: xml\n")));
        assert(throwsConfigError(load("sort.yml", "tree:\n  sort: date\n")));
        assert(throwsConfigError(load("bool.yml", "binary_strict: maybe\n")));
        assert(throwsConfigError(load("broken.yml", "include: [a, b\n")));
        assert(throwsConfigError(load("list.yml", "- a\n- b\n")));
        assert(throwsConfigError(load("map.yml", "include:\n  a: b\n")));

        std::cout << "✓ YAML errors test passed" << std::endl;
    }

    void testCommandOverrides() {
        std::cout << "Testing command-line overrides..." << std::endl;

        DumpConfig config;
        config.loadFromYaml(writeConfig("base.yml", "include: ['*.cpp']\nmax_tokens: 500\nformat: json\n"));

        Commands commands;
        commands.path = "project";
        commands.include_globs = {"*.hpp"};
        commands.exclude_globs = {"third_party"};
        commands.max_tokens = 100;
        commands.format = "html";
        commands.gitignore = false;
        commands.tree_depth = 0;
        commands.tree_sort = "size";
        commands.tree_dirs_first = false;
        commands.write_stdout = false;
        commands.outfile = "out.html";

        config.applyCommandOverrides(commands);
        assert(config.root_path == "project");
        assert(config.include_globs.size() == 2 && "Command-line globs are added to the file's");
        assert(config.exclude_globs.size() == 1);
        assert(*config.max_tokens == 100 && "Command line beats the config file");
        assert(config.format == OutputFormat::Html);
        assert(!config.use_gitignore);
        assert(config.binary_strict && "Options not given keep their values");
        assert(config.tree_depth && *config.tree_depth == 0);
        assert(config.tree_sort == SortKey::Size);
        assert(!config.tree_dirs_first);
        assert(!config.write_stdout && config.outfile == "out.html");

        Commands negative;
        negative.max_tokens = -5;
        assert(throwsConfigError([&] { DumpConfig().applyCommandOverrides(negative); }));

        Commands deep;
        deep.tree_depth = -1;
        assert(throwsConfigError([&] { DumpConfig().applyCommandOverrides(deep); }));

        std::cout << "✓ Command-line overrides test passed" << std::endl;
    }

    void testValidate() {
        std::cout << "Testing validation..." << std::endl;

        fs::create_directories(test_dir);

        DumpConfig valid;
        valid.root_path = test_dir.string();
        valid.validate();

        DumpConfig missing;
        missing.root_path = (test_dir / "does-not-exist").string();
        assert(throwsConfigError([&] { missing.validate(); }));

        DumpConfig empty_root;
        assert(throwsConfigError([&] { empty_root.validate(); }));

        DumpConfig conflict = valid;
        conflict.include_globs = {"*.cpp"};
        conflict.exclude_globs = {"*.cpp"};
        assert(throwsConfigError([&] { conflict.validate(); }));

        DumpConfig bad_glob = valid;
        bad_glob.exclude_globs = {"[abc"};
        assert(throwsConfigError([&] { bad_glob.validate(); }));

        DumpConfig bad_encoding = valid;
        bad_encoding.encoding = "ebcdic";
        assert(throwsConfigError([&] { bad_encoding.validate(); }));

        DumpConfig zero_cap = valid;
        zero_cap.max_tokens = 0;
        assert(throwsConfigError([&] { zero_cap.validate(); }));

        std::cout << "✓ Validation test passed" << std::endl;
    }

    void testDerivedOptions() {
        std::cout << "Testing derived options..." << std::endl;

        DumpConfig config;
        config.max_tokens = 42;
        config.tree_depth = 3;
        config.tree_sort = SortKey::Tokens;
        config.tree_show_size = true;

        Budget budget = config.budget();
        assert(*budget.max_tokens == 42 && *budget.max_size_bytes == 1048576);

        TreeOptions tree = config.treeOptions();
        assert(*tree.depth_limit == 3 && tree.sort_key == SortKey::Tokens && tree.dirs_first);

        RenderOptions render = config.renderOptions();
        assert(render.show_tree && render.show_tokens && render.show_size);

        std::cout << "✓ Derived options test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running DumpConfig unit tests..." << std::endl;

        testDefaults();
        testLoadFromYaml();
        testPartialAndEmptyYaml();
        testYamlErrors();
        testCommandOverrides();
        testValidate();
        testDerivedOptions();

        std::cout << "All DumpConfig tests passed!" << std::endl;
    }
};

int main() {
    try {
        DumpConfigTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
