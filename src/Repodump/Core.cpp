// =================================================================
// src/Repodump/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Repodump/Core.hpp"
#include "Repodump/DumpConfig.hpp"
#include "Repodump/Errors.hpp"
#include "Repodump/Logger.hpp"
#include "Repodump/Pipeline.hpp"
#include "Repodump/Renderer.hpp"
#include "Repodump/TextCodec.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace Repodump {

Core::Core(const Commands& commands) : m_commands(commands) {}

int Core::run() {
    auto start_time = std::chrono::steady_clock::now();
    configureLogging();
    Logger& logger = Logger::getInstance();

    auto finish = [&](int exit_code) {
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        logger.logSessionEnd(exit_code, static_cast<long>(duration.count()));
        logger.flush();
        return exit_code;
    };

    DumpConfig config;
    try {
        config = loadConfig();
    } catch (const ConfigError& e) {
        LOG_ERROR("Core", std::string("configuration error: ") + e.what());
        return finish(1);
    }

    logger.logSessionStart(config.root_path, outputFormatName(config.format));

    DumpResult result = Pipeline(config).run();
    if (!result.success) {
        // Pipeline has already logged the cause
        return finish(1);
    }

    auto renderer = Renderer::create(config.format, config.renderOptions());
    std::string output = renderer->render(result.root_name, result.tree, result.records, result.summary);

    if (!writeOutput(config, output)) {
        return finish(1);
    }
    return finish(0);
}

void Core::configureLogging() {
    Logger& logger = Logger::getInstance();
    logger.initialize(m_commands.log_dir);
    if (m_commands.verbose) {
        logger.setConsoleLogLevel(LogLevel::DEBUG);
    } else if (m_commands.quiet) {
        logger.setConsoleLogLevel(LogLevel::ERROR);
    } else {
        logger.setConsoleLogLevel(LogLevel::INFO);
    }
}

DumpConfig Core::loadConfig() const {
    DumpConfig config;
    config.root_path = m_commands.path;

    std::error_code ec;
    if (!m_commands.config_path.empty()) {
        if (!std::filesystem::is_regular_file(m_commands.config_path, ec)) {
            throw ConfigError("config file not found: " + m_commands.config_path);
        }
        config.loadFromYaml(m_commands.config_path);
    } else {
        std::string default_path = DumpConfig::defaultConfigPath(m_commands.path);
        if (std::filesystem::is_regular_file(default_path, ec)) {
            config.loadFromYaml(default_path);
        }
    }

    config.applyCommandOverrides(m_commands);
    return config;
}

bool Core::writeOutput(const DumpConfig& config, const std::string& output) const {
    if (!config.outfile.empty()) {
        TextCodec codec(TextCodec::parseEncoding(config.encoding));
        std::ofstream file(config.outfile, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            LOG_ERROR("Core", "Cannot open output file " + config.outfile);
            return false;
        }
        file << codec.encode(output);
        file.close();
        if (file.fail()) {
            LOG_ERROR("Core", "Failed writing output file " + config.outfile);
            return false;
        }
        LOG_INFO("Core", "Wrote dump to " + config.outfile);
    }

    if (config.write_stdout) {
        std::cout << output;
        std::cout.flush();
    }
    return true;
}

} // namespace Repodump
