#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

#include "director.hpp"
#include "model/config.hpp"
#include "util/error.hpp"

int main(int argc, char* argv[]) {
    Config cfg = defaultConfig();
    std::string err;
    bool configOk = false;

    if (argc >= 2 && std::string(argv[1]) == "--config") {
        if (argc < 3) {
            std::cerr << "Usage: " << argv[0] << " --config <path>" << std::endl;
            return EXIT_FAILURE;
        }
        configOk = parseConfigFile(argv[2], cfg, err);
    } else if (argc >= 2 && std::string(argv[1]) == "--defaults") {
        configOk = validateConfig(cfg, err);
    } else {
        // default config file paths: current dir then parent
        std::string errLocal;
        configOk = parseConfigFile("config.cfg", cfg, errLocal);
        if (!configOk) {
            std::string errParent;
            configOk = parseConfigFile("../config.cfg", cfg, errParent);
            if (!configOk) {
                err = "Cannot open config file: tried config.cfg and ../config.cfg (" + errLocal + ")";
            }
        }
    }

    if (!configOk) {
        die("Config error: " + err);
    }

    Director director;
    int rc = director.run(cfg);
    if (rc != 0) {
        die("ED simulation failed");
    }

    std::cout << "ED simulation finished, log: " << director.lastLogPath() << std::endl;
    const std::string& summaryPath = director.lastSummaryPath();
    if (summaryPath.empty()) {
        std::cerr << "No summary file was written" << std::endl;
        return EXIT_SUCCESS;
    }
    std::ifstream in(summaryPath);
    if (!in) {
        std::cerr << "Failed to open summary file: " << summaryPath << std::endl;
        return EXIT_SUCCESS;
    }
    std::cout << "\n=== " << summaryPath << " ===\n";
    std::cout << in.rdbuf() << std::flush;
    return EXIT_SUCCESS;
}
