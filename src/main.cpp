#include "CleanConfig.h"
#include "CleaningRunner.h"
#include "ScrubExceptions.h"
#include <cstring>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            std::cout << CleanConfig::usage();
            return 0;
        }
    }

    try {
        const CleanConfig config = CleanConfig::fromArgs(argc, argv);
        CleaningRunner runner(config);
        runner.run(std::cout);
    } catch (const Scrub::ScrubException& e) {
        std::cerr << "[Scrub][Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Scrub][Exception] " << e.what() << "\n";
        return 1;
    }

    return 0;
}
