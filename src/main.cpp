#include "GameManager.h"
#include "GameConfig.h"
#include "MyTargetingAlgorithmFactory.h"
#include "utils.h"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace naval;

int main(int argc, char** argv) {
    if (argc > 2) {
        std::cerr << "Usage: naval_strike [config_file]\n";
        return 1;
    }

    GameConfig config;
    if (argc == 2) {
        std::string error;
        if (!loadConfig(argv[1], config, error)) {
            std::cerr << "Invalid config: " << error << "\n";
            return 1;
        }
    }
    setVerbose(config.verbose);

    try {
        GameManager gm(config, MyTargetingAlgorithmFactory(config.sinkPolicy));
        return gm.run(std::cin, std::cout);
    } catch (const std::logic_error& e) {
        std::cerr << "Internal error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
