#include "Convoy/CliParser.hpp"
#include "Convoy/Core.hpp"
#include <iostream>

int main(int argc, char** argv) {
    // CliParser defines and parses all command-line arguments using CLI11.
    Convoy::CliParser parser;
    auto app = parser.setupCli();

    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 2;
    }

    // Core loads configuration and dispatches to the selected command.
    try {
        Convoy::Core core(parser.getCommands());
        return core.run();
    } catch (const std::exception& e) {
        std::cerr << "Error during execution: " << e.what() << std::endl;
        return 2;
    }
}
