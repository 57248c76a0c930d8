#pragma once
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace Log
{
    inline void init(const std::string& file = "gdauth.log",
        spdlog::level::level_enum level = spdlog::level::info)
    {
        // Replace a logger left over from an earlier init()
        spdlog::drop("gdauth_file");
        auto file_logger = spdlog::basic_logger_mt("gdauth_file", file);

        spdlog::set_default_logger(file_logger);

        // Set global log pattern ONCE
        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        spdlog::set_level(level);
        spdlog::flush_on(spdlog::level::info);

        spdlog::info("Logging initialized to '{}'", file);
    }
}
