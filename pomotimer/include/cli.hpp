#ifndef CLI_HPP
#define CLI_HPP

#include <iostream>
#include <string>

struct CliOptions {
    std::string duration;
    std::string label = "TIMER";
    bool verbose = false;
    bool help = false;
};

// Collects flags and positionals. Flags count only before DURATION or a
// "--". Throws MissingArgument when DURATION is absent, unless help was
// asked for.
CliOptions parse_args(int argc, const char* const argv[]);

void print_usage(std::ostream& out, bool full = false);

// Runs the whole program and returns the process exit status:
// 0 completed, 1 usage, 2 invalid duration or config, 130 interrupted.
int run_cli(int argc, const char* const argv[], std::ostream& out = std::cout);

#endif // CLI_HPP
