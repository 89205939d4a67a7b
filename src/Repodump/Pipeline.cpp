// =================================================================
// src/Repodump/Pipeline.cpp
// =================================================================
// Implementation for the dump pipeline.

#include "Repodump/Pipeline.hpp"
#include "Repodump/BudgetEnforcer.hpp"
#include "Repodump/Errors.hpp"
#include "Repodump/FileCollector.hpp"
#include "Repodump/Logger.hpp"
#include "Repodump/PathMatcher.hpp"
#include "Repodump/TextCodec.hpp"
#include <filesystem>

namespace Repodump {

Pipeline::Pipeline(DumpConfig config) : m_config(std::move(config)) {}

DumpResult Pipeline::run() const {
    DumpResult result;
    try {
        execute(result);
        result.success = true;
    } catch (const ConfigError& e) {
        result = DumpResult();
        result.error = std::string("configuration error: ") + e.what();
        LOG_ERROR("Pipeline", result.error);
    } catch (const std::exception& e) {
        result = DumpResult();
        result.error = std::string("dump failed: ") + e.what();
        LOG_ERROR("Pipeline", result.error);
    }
    return result;
}

void Pipeline::execute(DumpResult& result) const {
    m_config.validate();

    PathMatcher matcher = PathMatcher::create(m_config.include_globs,
                                              m_config.exclude_globs,
                                              m_config.use_gitignore);
    Budget budget = m_config.budget();

    // Step 1: walk and load
    FileCollector collector(m_config.root_path);
    collector.setMaxFileSize(budget.max_size_bytes);
    collector.setBinaryStrict(m_config.binary_strict);
    collector.setEncoding(TextCodec::parseEncoding(m_config.encoding));

    CollectionResult collected = collector.collect(matcher);
    Logger::getInstance().logCollection(collected.stats);

    // Step 2: fit the token cap
    BudgetEnforcer enforcer;
    BudgetResult budgeted = enforcer.enforce(std::move(collected.records), budget);
    Logger::getInstance().logBudget(budgeted, budget.max_tokens.value_or(0));

    // Step 3: records are final from here on; the tree points into them
    result.root_name = rootName(m_config.root_path);
    result.records = std::move(budgeted.records);
    result.summary = summarize(result.records, collected.stats, budgeted, budget);
    result.tree = TreeAggregator::build(result.records, m_config.treeOptions());

    LOG_INFO("Pipeline", "Dump ready: " + std::to_string(result.summary.included_files) +
             " files, " + std::to_string(result.summary.total_tokens) + " tokens");
}

std::string Pipeline::rootName(const std::string& root_path) {
    std::filesystem::path path = std::filesystem::absolute(root_path).lexically_normal();
    if (!path.has_filename() && path.has_parent_path() && path != path.root_path()) {
        path = path.parent_path();
    }
    std::string name = path.filename().string();
    return name.empty() ? path.string() : name;
}

DumpResult dump(const DumpConfig& config) {
    return Pipeline(config).run();
}

} // namespace Repodump
