// =================================================================
// tests/FileCollectorTest.cpp
// =================================================================
// Unit tests for FileCollector traversal, filtering and loading.

#include "Repodump/FileCollector.hpp"
#include "Repodump/PathMatcher.hpp"
#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;
using namespace Repodump;

class FileCollectorTest {
private:
    fs::path test_dir;

    void writeFile(const std::string& relative, const std::string& content) {
        fs::path path = test_dir / relative;
        fs::create_directories(path.parent_path());
        std::ofstream(path, std::ios::binary) << content;
    }

    void resetTestDir() {
        cleanupTestFiles();
        fs::create_directories(test_dir);
    }

    void cleanupTestFiles() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

    static std::vector<std::string> paths(const CollectionResult& result) {
        std::vector<std::string> list;
        for (const auto& record : result.records) {
            list.push_back(record.pathString());
        }
        return list;
    }

    static const FileRecord* find(const CollectionResult& result, const std::string& path) {
        for (const auto& record : result.records) {
            if (record.pathString() == path) {
                return &record;
            }
        }
        return nullptr;
    }

    CollectionResult collectDefault() {
        FileCollector collector(test_dir.string());
        PathMatcher matcher = PathMatcher::create({}, {}, true);
        return collector.collect(matcher);
    }

public:
    FileCollectorTest() : test_dir(fs::temp_directory_path() / "repodump_file_collector_test") {}

    ~FileCollectorTest() { cleanupTestFiles(); }

    void testDeterministicOrder() {
        std::cout << "Testing deterministic walk order..." << std::endl;

        resetTestDir();
        writeFile("b.txt", "b");
        writeFile("a.txt", "a");
        writeFile("dir/c.txt", "c");
        writeFile("Z.txt", "z");

        CollectionResult first = collectDefault();
        CollectionResult second = collectDefault();

        std::vector<std::string> expected = {"Z.txt", "a.txt", "b.txt", "dir/c.txt"};
        assert(paths(first) == expected && "Entries are visited in byte order, depth first");
        assert(paths(second) == expected && "Repeated walks yield the same sequence");
        assert(first.stats.directories_visited == 2);

        std::cout << "✓ Deterministic order test passed" << std::endl;
    }

    void testNestedDirectoryExclusion() {
        std::cout << "Testing nested directory exclusion..." << std::endl;

        resetTestDir();
        writeFile("a/b/node_modules/c/d.txt", "dependency");
        writeFile("a/b/keep.txt", "keep");

        FileCollector collector(test_dir.string());
        PathMatcher matcher = PathMatcher::create({}, {"node_modules"}, true);
        CollectionResult result = collector.collect(matcher);

        for (const auto& path : paths(result)) {
            assert(path.find("node_modules") == std::string::npos && "Excluded directory must be pruned");
        }
        assert(find(result, "a/b/keep.txt") != nullptr);
        assert(result.stats.excluded_paths == 1 && "Pruned directory counts once");

        std::cout << "✓ Nested directory exclusion test passed" << std::endl;
    }

    void testGitignoreNegation() {
        std::cout << "Testing .gitignore negation..." << std::endl;

        resetTestDir();
        writeFile(".gitignore", "*.log\n!keep.log\n");
        writeFile("debug.log", "noise");
        writeFile("keep.log", "signal");
        writeFile("main.cpp", "int main() {}");

        CollectionResult result = collectDefault();
        assert(find(result, "debug.log") == nullptr);
        assert(find(result, "keep.log") != nullptr && "Negated file is re-included");
        assert(find(result, "main.cpp") != nullptr);
        assert(result.stats.gitignore_files == 1);

        FileCollector collector(test_dir.string());
        PathMatcher ignoring_off = PathMatcher::create({}, {}, false);
        CollectionResult unfiltered = collector.collect(ignoring_off);
        assert(find(unfiltered, "debug.log") != nullptr && "--no-gitignore keeps ignored files");

        std::cout << "✓ .gitignore negation test passed" << std::endl;
    }

    void testNestedGitignoreScope() {
        std::cout << "Testing nested .gitignore scope..." << std::endl;

        resetTestDir();
        writeFile(".gitignore", "*.tmp\n");
        writeFile("sub/.gitignore", "!local.tmp\n");
        writeFile("a.tmp", "x");
        writeFile("sub/local.tmp", "x");
        writeFile("sub/other.tmp", "x");
        writeFile("other/local.tmp", "x");

        CollectionResult result = collectDefault();
        assert(find(result, "a.tmp") == nullptr);
        assert(find(result, "sub/local.tmp") != nullptr && "Deeper rule overrides the root rule");
        assert(find(result, "sub/other.tmp") == nullptr);
        assert(find(result, "other/local.tmp") == nullptr && "Rules do not leak into sibling directories");

        std::cout << "✓ Nested .gitignore scope test passed" << std::endl;
    }

    void testBinaryDetection() {
        std::cout << "Testing binary detection..." << std::endl;

        resetTestDir();
        writeFile("data.dat", std::string("abc\0def", 7));
        writeFile("image.png", "not really an image");
        writeFile("controls.dat", std::string(100, '\x01') + "text");
        writeFile("notes.txt", "plain text\n");

        CollectionResult strict = collectDefault();
        assert(find(strict, "data.dat")->status() == FileStatus::SkippedBinary && "Null byte marks binary");
        assert(find(strict, "image.png")->status() == FileStatus::SkippedBinary && "Known binary extension");
        assert(find(strict, "controls.dat")->status() == FileStatus::SkippedBinary && "Mostly control bytes");
        assert(find(strict, "notes.txt")->status() == FileStatus::Included);
        assert(find(strict, "data.dat")->content.empty());
        assert(find(strict, "data.dat")->token_count == 0);

        FileCollector lenient(test_dir.string());
        lenient.setBinaryStrict(false);
        PathMatcher matcher = PathMatcher::create({}, {}, true);
        CollectionResult relaxed = lenient.collect(matcher);
        assert(find(relaxed, "controls.dat")->status() == FileStatus::Included && "Lenient mode only checks null bytes");
        assert(find(relaxed, "data.dat")->status() == FileStatus::SkippedBinary);
        assert(find(relaxed, "image.png")->status() == FileStatus::SkippedBinary);

        assert(FileCollector::looksBinary("a.txt", "\xC3\xA9t\xC3\xA9\n", true) == false && "UTF-8 text is text");
        assert(FileCollector::hasTextExtension("Makefile"));
        assert(FileCollector::hasTextExtension(".gitignore"));
        assert(FileCollector::hasBinaryExtension("LIB.SO"));

        std::cout << "✓ Binary detection test passed" << std::endl;
    }

    void testSizeLimit() {
        std::cout << "Testing file size limit..." << std::endl;

        resetTestDir();
        writeFile("big.txt", std::string(20, 'x'));
        writeFile("small.txt", "tiny");

        FileCollector collector(test_dir.string());
        collector.setMaxFileSize(10);
        PathMatcher matcher = PathMatcher::create({}, {}, true);
        CollectionResult result = collector.collect(matcher);

        const FileRecord* big = find(result, "big.txt");
        assert(big->status() == FileStatus::SkippedTooLarge);
        assert(big->size_bytes == 20);
        assert(big->content.empty() && big->token_count == 0);
        assert(find(result, "small.txt")->status() == FileStatus::Included);

        collector.setMaxFileSize(std::nullopt);
        CollectionResult unlimited = collector.collect(matcher);
        assert(find(unlimited, "big.txt")->status() == FileStatus::Included);

        std::cout << "✓ File size limit test passed" << std::endl;
    }

    void testContentAndTokens() {
        std::cout << "Testing content loading..." << std::endl;

        resetTestDir();
        writeFile("eight.txt", "abcdefgh");
        writeFile("empty.txt", "");
        writeFile("bad.txt", "ok\xFF\n");

        CollectionResult result = collectDefault();

        const FileRecord* eight = find(result, "eight.txt");
        assert(eight->content == "abcdefgh");
        assert(eight->size_bytes == 8);
        assert(eight->token_count == 2);
        assert(eight->original_tokens == 2);
        assert(!eight->lossy_decoded);

        const FileRecord* empty = find(result, "empty.txt");
        assert(empty->status() == FileStatus::Included);
        assert(empty->token_count == 0);

        const FileRecord* bad = find(result, "bad.txt");
        assert(bad->status() == FileStatus::Included);
        assert(bad->lossy_decoded && "Invalid UTF-8 is replaced, not fatal");

        FileCollector latin1(test_dir.string());
        latin1.setEncoding(TextEncoding::Latin1);
        PathMatcher matcher = PathMatcher::create({}, {}, true);
        CollectionResult transcoded = latin1.collect(matcher);
        assert(!find(transcoded, "bad.txt")->lossy_decoded && "Every byte is valid latin-1");

        std::cout << "✓ Content loading test passed" << std::endl;
    }

    void testSymlinks() {
        std::cout << "Testing symbolic links..." << std::endl;

        resetTestDir();
        fs::path outside = fs::temp_directory_path() / "repodump_file_collector_outside.txt";
        std::ofstream(outside) << "secret";
        writeFile("inside.txt", "visible");

        try {
            fs::create_symlink(outside, test_dir / "escape.txt");
            fs::create_directory_symlink(test_dir, test_dir / "loop");
        } catch (const fs::filesystem_error& e) {
            std::cout << "  (symlinks unavailable, skipping: " << e.what() << ")" << std::endl;
            fs::remove(outside);
            return;
        }

        CollectionResult result = collectDefault();
        const FileRecord* escape = find(result, "escape.txt");
        assert(escape != nullptr);
        assert(escape->status() == FileStatus::SkippedExcluded && "Links leaving the root are excluded");
        assert(escape->content.empty());
        assert(result.stats.symlinks_outside_root == 1);
        assert(result.stats.cycles_skipped == 1 && "Directory cycle is not re-entered");
        assert(find(result, "inside.txt") != nullptr);

        fs::remove(outside);
        std::cout << "✓ Symbolic links test passed" << std::endl;
    }

    void testIncludeGlobs() {
        std::cout << "Testing include globs..." << std::endl;

        resetTestDir();
        writeFile("src/main.cpp", "int main() {}");
        writeFile("src/notes.md", "# notes");
        writeFile("README.md", "# readme");

        FileCollector collector(test_dir.string());
        PathMatcher matcher = PathMatcher::create({"*.cpp"}, {}, true);
        CollectionResult result = collector.collect(matcher);

        std::vector<std::string> expected = {"src/main.cpp"};
        assert(paths(result) == expected);

        std::cout << "✓ Include globs test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running FileCollector unit tests..." << std::endl;

        testDeterministicOrder();
        testNestedDirectoryExclusion();
        testGitignoreNegation();
        testNestedGitignoreScope();
        testBinaryDetection();
        testSizeLimit();
        testContentAndTokens();
        testSymlinks();
        testIncludeGlobs();

        cleanupTestFiles();
        std::cout << "All FileCollector tests passed!" << std::endl;
    }
};

int main() {
    try {
        FileCollectorTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
