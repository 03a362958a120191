#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <memory>

#include <spdlog/spdlog.h>

// The "pomotimer" logger. Writes to stderr so stdout only carries the bar.
std::shared_ptr<spdlog::logger> logger();

// debug when verbose, warn otherwise.
void set_verbose(bool verbose);

#endif // LOGGING_HPP
