#ifndef LOGGING_H
#define LOGGING_H

#include <memory>

#include <spdlog/spdlog.h>

namespace utility
{
    // the process-wide "drawio" logger, writing to stderr
    [[nodiscard]]
    auto logger() -> std::shared_ptr<spdlog::logger>;

    auto set_log_level(spdlog::level::level_enum level) -> void;
}

#endif
