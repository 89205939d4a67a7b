
#include "Repodump/CliParser.hpp"
#include "Repodump/Core.hpp"
#include <iostream>

int main(int argc, char** argv) {
    // CliParser defines and parses all command-line arguments with CLI11.
    Repodump::CliParser parser;
    auto app = parser.setupCli();

    // CLI11 reports --help, --version and bad arguments as exceptions;
    // app->exit() prints them and picks the exit code.
    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    Repodump::Core core(parser.getCommands());

    try {
        return core.run();
    } catch (const std::exception& e) {
        std::cerr << "Error during execution: " << e.what() << std::endl;
        return 1;
    }
}
