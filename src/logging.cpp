#include "../include/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace utility
{
    static auto make_logger() -> std::shared_ptr<spdlog::logger>
    {
        try
        {
            auto logger = spdlog::stderr_color_mt("drawio");
            logger->set_level(spdlog::level::warn);
            logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
            return logger;
        }
        catch (const spdlog::spdlog_ex&)
        {
            // already registered (e.g. by a test harness)
            if (auto existing = spdlog::get("drawio"))
            {
                return existing;
            }
            return spdlog::default_logger();
        }
    }

    auto logger() -> std::shared_ptr<spdlog::logger>
    {
        static const auto instance = make_logger();
        return instance;
    }

    auto set_log_level(spdlog::level::level_enum level) -> void
    {
        logger()->set_level(level);
    }
}
