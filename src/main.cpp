#include "app/Application.hpp"
#include "app/CommandLine.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::string error;
    auto commandLine = pingsweep::app::parseCommandLine(args, error);
    if (!commandLine) {
        if (!error.empty()) {
            std::cerr << "pingsweep: " << error << "\n\n";
        }
        pingsweep::app::printUsage(error.empty() ? std::cout : std::cerr);
        return error.empty() ? 0 : pingsweep::app::Application::EXIT_CANNOT_RUN;
    }

    try {
        pingsweep::app::Application app(std::move(*commandLine), std::cout);
        return app.run();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return pingsweep::app::Application::EXIT_CANNOT_RUN;
    }
}
