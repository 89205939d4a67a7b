// =================================================================
// include/Repodump/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "Repodump/CliParser.hpp"
#include <string>

namespace Repodump {

struct DumpConfig;

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Loads configuration, produces the dump and writes it out.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    void configureLogging();

    /**
     * @brief Build the run configuration from the config file and command line
     * @throws ConfigError if the config file is missing or invalid
     */
    DumpConfig loadConfig() const;

    /**
     * @brief Write the rendered dump to --outfile and/or stdout
     * @return false if the output file could not be written
     */
    bool writeOutput(const DumpConfig& config, const std::string& output) const;

    const Commands& m_commands;
};

} // namespace Repodump
