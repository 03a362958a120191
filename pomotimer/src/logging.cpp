#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto created = spdlog::stderr_color_mt("pomotimer");
        created->set_pattern("[%n] [%^%l%$] %v");
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return instance;
}

void set_verbose(bool verbose) {
    logger()->set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}
