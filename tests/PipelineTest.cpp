// =================================================================
// tests/PipelineTest.cpp
// =================================================================
// End-to-end tests for the dump pipeline and the application core.

#include "Repodump/Pipeline.hpp"
#include "Repodump/Core.hpp"
#include "Repodump/Logger.hpp"
#include "Repodump/Renderer.hpp"
#include "nlohmann/json.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;
using namespace Repodump;

namespace {

void writeFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream(path, std::ios::binary) << content;
}

std::string readFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

const FileRecord* findRecord(const DumpResult& result, const std::string& path) {
    for (const auto& record : result.records) {
        if (record.pathString() == path) {
            return &record;
        }
    }
    return nullptr;
}

} // anonymous namespace

class PipelineTest {
private:
    fs::path test_dir;

    void setupTestFiles() {
        cleanupTestFiles();
        writeFile(test_dir / "src/main.cpp", "#include \"util.hpp\"\nint main() { return run(); }\n");
        writeFile(test_dir / "src/util.hpp", "#pragma once\nint run();\n");
        writeFile(test_dir / "README.md", "# Project\n\nSome words about it.\n");
        writeFile(test_dir / "node_modules/pkg/index.js", "module.exports = {};\n");
        writeFile(test_dir / ".gitignore", "*.log\n");
        writeFile(test_dir / "debug.log", "noise\n");
        writeFile(test_dir / "logo.png", std::string("\x89PNG\r\n\x1a\n\0\0", 10));
        writeFile(test_dir / ".git/config", "[core]\n");
        writeFile(test_dir / "docs/big.md", std::string(4000, 'd') + "\n");
    }

    void cleanupTestFiles() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

    DumpConfig baseConfig() const {
        DumpConfig config;
        config.root_path = test_dir.string();
        config.exclude_globs = {"node_modules"};
        return config;
    }

public:
    PipelineTest() : test_dir(fs::temp_directory_path() / "repodump_pipeline_test") {}

    ~PipelineTest() { cleanupTestFiles(); }

    void testEndToEnd() {
        std::cout << "Testing end-to-end dump..." << std::endl;

        setupTestFiles();
        DumpResult result = dump(baseConfig());

        assert(result.success);
        assert(result.error.empty());
        assert(result.root_name == "repodump_pipeline_test");

        assert(findRecord(result, "src/main.cpp") != nullptr);
        assert(findRecord(result, "README.md") != nullptr);
        assert(findRecord(result, ".gitignore") != nullptr);
        assert(findRecord(result, "debug.log") == nullptr && ".gitignore is respected");
        assert(findRecord(result, ".git/config") == nullptr && ".git is excluded by default");
        for (const auto& record : result.records) {
            assert(record.pathString().find("node_modules") == std::string::npos);
        }
        assert(findRecord(result, "logo.png")->status() == FileStatus::SkippedBinary);

        const ScanSummary& summary = result.summary;
        assert(summary.included_files == 5);
        assert(summary.skipped_binary == 1);
        assert(summary.excluded_paths == 3 && "node_modules, .git and debug.log");
        assert(summary.total_tokens == result.tree.root().aggregate_tokens);
        assert(summary.tokens_before_budget == summary.total_tokens);

        std::cout << "✓ End-to-end dump test passed" << std::endl;
    }

    void testDeterminism() {
        std::cout << "Testing deterministic output..." << std::endl;

        setupTestFiles();
        auto renderer = Renderer::create(OutputFormat::Text, RenderOptions());

        DumpResult first = dump(baseConfig());
        DumpResult second = dump(baseConfig());
        std::string first_output = renderer->render(first.root_name, first.tree, first.records, first.summary);
        std::string second_output = renderer->render(second.root_name, second.tree, second.records, second.summary);
        assert(first_output == second_output && "Unchanged inputs give byte-identical dumps");

        std::cout << "✓ Deterministic output test passed" << std::endl;
    }

    void testBudget() {
        std::cout << "Testing token budget end to end..." << std::endl;

        setupTestFiles();
        DumpConfig config = baseConfig();
        config.max_tokens = 200;
        DumpResult result = dump(config);

        assert(result.success);
        assert(result.summary.total_tokens <= 200);
        assert(result.summary.tokens_before_budget > 200);
        std::uint64_t sum = 0;
        for (const auto& record : result.records) {
            sum += record.token_count;
        }
        assert(sum == result.summary.total_tokens);

        const FileRecord* big = findRecord(result, "docs/big.md");
        assert(big->status() == FileStatus::Truncated || big->status() == FileStatus::Dropped);
        assert(findRecord(result, "src/util.hpp")->status() == FileStatus::Included && "Small files survive");

        std::cout << "✓ Token budget test passed" << std::endl;
    }

    void testFailures() {
        std::cout << "Testing failed dumps..." << std::endl;

        setupTestFiles();

        DumpConfig missing = baseConfig();
        missing.root_path = (test_dir / "nope").string();
        DumpResult missing_result = dump(missing);
        assert(!missing_result.success);
        assert(missing_result.error.find("configuration error") != std::string::npos);
        assert(missing_result.records.empty());

        DumpConfig conflict = baseConfig();
        conflict.include_globs = {"node_modules"};
        assert(!dump(conflict).success && "Conflicting globs fail before traversal");

        DumpConfig bad_encoding = baseConfig();
        bad_encoding.encoding = "klingon";
        assert(!dump(bad_encoding).success);

        std::cout << "✓ Failed dumps test passed" << std::endl;
    }

    void testTreeSurvivesMove() {
        std::cout << "Testing tree references after move..." << std::endl;

        setupTestFiles();
        DumpResult moved;
        {
            DumpResult original = dump(baseConfig());
            moved = std::move(original);
        }

        const FileRecord* begin = moved.records.data();
        const FileRecord* end = begin + moved.records.size();
        for (const TreeEntry* entry : moved.tree.visibleChildren(moved.tree.root())) {
            if (!entry->isDirectory()) {
                assert(entry->file >= begin && entry->file < end && "Tree points into the moved records");
            }
        }

        std::cout << "✓ Tree references test passed" << std::endl;
    }

    void testRootName() {
        std::cout << "Testing root names..." << std::endl;

        assert(Pipeline::rootName("/tmp/project/") == "project");
        assert(Pipeline::rootName("/tmp/project") == "project");
        assert(Pipeline::rootName("/tmp/project/src/..") == "project");
        assert(!Pipeline::rootName(".").empty());

        std::cout << "✓ Root names test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Pipeline tests..." << std::endl;

        testEndToEnd();
        testDeterminism();
        testBudget();
        testFailures();
        testTreeSurvivesMove();
        testRootName();

        cleanupTestFiles();
        std::cout << "All Pipeline tests passed!" << std::endl;
    }
};

class CoreTest {
private:
    fs::path test_dir;

    void cleanupTestFiles() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

public:
    CoreTest() : test_dir(fs::temp_directory_path() / "repodump_core_test") {}

    ~CoreTest() { cleanupTestFiles(); }

    void testOutfileWithConfigFile() {
        std::cout << "Testing outfile and config file..." << std::endl;

        cleanupTestFiles();
        writeFile(test_dir / "project/src/main.cpp", "int main() {}\n");
        writeFile(test_dir / "project/.repodump.yml", "format: json\ntree:\n  depth: 1\n");
        fs::path outfile = test_dir / "dump.json";

        Commands commands;
        commands.path = (test_dir / "project").string();
        commands.outfile = outfile.string();
        commands.write_stdout = false;
        commands.quiet = true;

        Core core(commands);
        assert(core.run() == 0);

        nlohmann::json document = nlohmann::json::parse(readFile(outfile));
        assert(document["root"] == "project");
        bool found = false;
        for (const auto& file : document["files"]) {
            if (file["path"] == "src/main.cpp") {
                found = true;
                assert(file["content"] == "int main() {}\n");
            }
        }
        assert(found);
        assert(document["tree"]["children"][0]["collapsed"] == true && "Depth 1 hides src's children");

        std::cout << "✓ Outfile and config file test passed" << std::endl;
    }

    void testOutfileEncoding() {
        std::cout << "Testing outfile encoding..." << std::endl;

        cleanupTestFiles();
        writeFile(test_dir / "project/cafe.txt", "caf\xE9\n");
        fs::path outfile = test_dir / "dump.txt";

        Commands commands;
        commands.path = (test_dir / "project").string();
        commands.outfile = outfile.string();
        commands.encoding = "latin-1";
        commands.write_stdout = false;
        commands.quiet = true;

        Core core(commands);
        assert(core.run() == 0);

        std::string written = readFile(outfile);
        assert(written.find("caf\xE9\n") != std::string::npos && "Output is encoded back to latin-1");
        assert(written.find("caf\xC3\xA9") == std::string::npos);

        std::cout << "✓ Outfile encoding test passed" << std::endl;
    }

    void testFailuresReturnNonZero() {
        std::cout << "Testing failure exit codes..." << std::endl;

        cleanupTestFiles();
        fs::create_directories(test_dir / "project");

        Commands missing_root;
        missing_root.path = (test_dir / "missing").string();
        missing_root.quiet = true;
        assert(Core(missing_root).run() == 1);

        Commands missing_config;
        missing_config.path = (test_dir / "project").string();
        missing_config.config_path = (test_dir / "absent.yml").string();
        missing_config.quiet = true;
        assert(Core(missing_config).run() == 1);

        Commands bad_budget;
        bad_budget.path = (test_dir / "project").string();
        bad_budget.max_tokens = 0;
        bad_budget.quiet = true;
        assert(Core(bad_budget).run() == 1);

        std::cout << "✓ Failure exit codes test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Core tests..." << std::endl;

        testOutfileWithConfigFile();
        testOutfileEncoding();
        testFailuresReturnNonZero();

        cleanupTestFiles();
        std::cout << "All Core tests passed!" << std::endl;
    }
};

int main() {
    try {
        PipelineTest pipeline_tests;
        pipeline_tests.runAllTests();

        std::cout << std::endl;

        CoreTest core_tests;
        core_tests.runAllTests();

        std::cout << "\nAll Pipeline component tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
