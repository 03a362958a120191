#include "cli.hpp"
#include "cancellation.hpp"
#include "countdown_timer.hpp"
#include "duration_parser.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <vector>

namespace {

const int EXIT_USAGE = 1;
const int EXIT_INVALID = 2;
const int EXIT_INTERRUPTED = 130;

}  // namespace

CliOptions parse_args(int argc, const char* const argv[]) {
    CliOptions options;
    std::vector<std::string> positionals;
    // Flags are only read ahead of DURATION, so LABEL stays free text.
    bool flags_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (!flags_done && arg == "--") {
            flags_done = true;
        } else if (!flags_done && (arg == "-v" || arg == "--verbose")) {
            options.verbose = true;
        } else if (!flags_done && (arg == "-h" || arg == "--help")) {
            options.help = true;
        } else {
            positionals.push_back(arg);
            flags_done = true;
        }
    }

    if (positionals.empty()) {
        if (options.help) {
            return options;
        }
        throw MissingArgument("duration is required");
    }
    options.duration = positionals[0];
    if (positionals.size() > 1) {
        options.label = positionals[1];
    }
    return options;
}

void print_usage(std::ostream& out, bool full) {
    out << "Usage: pomotimer DURATION [LABEL]" << "\n"
        << "  DURATION examples: 25m, 90s, 1m30s, 25:00, 1500" << "\n";
    if (full) {
        out << "  LABEL optional: e.g., 'FOCUS'" << "\n";
    }
    out << std::flush;
}

int run_cli(int argc, const char* const argv[], std::ostream& out) {
    CliOptions options;
    try {
        options = parse_args(argc, argv);
    } catch (const MissingArgument&) {
        print_usage(out);
        return EXIT_USAGE;
    }

    if (options.help) {
        print_usage(out, true);
        return 0;
    }
    set_verbose(options.verbose);

    TimerConfig config;
    config.label = options.label;
    try {
        config.total_seconds = parse_duration(options.duration);
        logger()->debug("parsed '{}' as {}s", options.duration, config.total_seconds);
    } catch (const InvalidDuration& e) {
        logger()->error("{}", e.what());
        return EXIT_INVALID;
    }

    TimerOutcome outcome = TimerOutcome::completed;
    CancellationToken token;
    try {
        CountdownTimer timer(config, out);
        InterruptAdapter interrupts(token);
        outcome = timer.run(token);
    } catch (const InvalidConfig& e) {
        logger()->error("{}", e.what());
        return EXIT_INVALID;
    }

    if (outcome == TimerOutcome::interrupted || token.is_cancelled()) {
        return EXIT_INTERRUPTED;
    }
    return 0;
}
