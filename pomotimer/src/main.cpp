#include <exception>

#include "cli.hpp"
#include "logging.hpp"

int main(int argc, char* argv[]) {
    try {
        return run_cli(argc, argv);
    } catch (const std::exception& e) {
        logger()->critical("{}", e.what());
        return 1;
    }
}
