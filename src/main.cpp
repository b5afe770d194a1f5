#include "application/controllers/ApplicationController.hpp"
#include "logger/Logger.hpp"
#include <iostream>
#include <string>

namespace {
    void printUsage(const char *program) {
        std::cerr << "Usage: " << program << " [config.json] [receipt|status|image-test]" << std::endl;
    }
}

int main(int argc, char *argv[]) {
    std::string configPath = "config/config.json";
    std::string mode = "receipt";

    if (argc > 3) {
        printUsage(argv[0]);
        return 2;
    }
    if (argc == 2) {
        const std::string arg = argv[1];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        // Un solo argomento: file di configurazione se termina in .json, altrimenti comando
        if (arg.size() > 5 && arg.compare(arg.size() - 5, 5, ".json") == 0) {
            configPath = arg;
        } else {
            mode = arg;
        }
    }
    if (argc == 3) {
        configPath = argv[1];
        mode = argv[2];
    }

    int exitCode = 1;
    try {
        ApplicationController app;
        if (app.initialize(configPath)) {
            exitCode = app.run(mode);
        }
        app.shutdown();
    } catch (const std::exception &ex) {
        Logger::logError("Fatal error: " + std::string(ex.what()));
        exitCode = 1;
    }

    Logger::shutdown();
    return exitCode;
}
