// =================================================================
// include/Repodump/Pipeline.hpp
// =================================================================
// Defines the programmatic entry point that produces a dump.

#pragma once

#include "DumpConfig.hpp"
#include "FileRecord.hpp"
#include "Summary.hpp"
#include "TreeAggregator.hpp"
#include <string>
#include <vector>

namespace Repodump {

/**
 * @brief Everything a renderer needs, or the reason there is nothing
 *
 * The tree points into records. Moving a DumpResult keeps those pointers
 * valid; copying is disabled.
 */
struct DumpResult {
    bool success = false;
    std::string error;
    std::string root_name;
    std::vector<FileRecord> records;
    DirectoryTree tree;
    ScanSummary summary;

    DumpResult() = default;
    DumpResult(DumpResult&&) = default;
    DumpResult& operator=(DumpResult&&) = default;
    DumpResult(const DumpResult&) = delete;
    DumpResult& operator=(const DumpResult&) = delete;
};

/**
 * @brief Runs collection, budget enforcement, aggregation and summary
 */
class Pipeline {
public:
    explicit Pipeline(DumpConfig config);

    /**
     * @brief Produce a dump for the configured root
     *
     * Never throws: configuration problems and unexpected failures come
     * back as a DumpResult with success == false and an error message.
     */
    DumpResult run() const;

    const DumpConfig& config() const { return m_config; }

    /**
     * @brief Display name for a root path ("." resolves to the directory name)
     */
    static std::string rootName(const std::string& root_path);

private:
    DumpConfig m_config;

    void execute(DumpResult& result) const;
};

/**
 * @brief Shorthand for Pipeline(config).run()
 */
DumpResult dump(const DumpConfig& config);

} // namespace Repodump
