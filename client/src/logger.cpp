#include "nimbus/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <vector>

namespace nimbus::client
{

    Logger::Logger()
        : logger_(std::make_shared<spdlog::logger>("nimbus", std::make_shared<spdlog::sinks::null_sink_mt>())) {}

    Logger::Logger(const std::optional<std::filesystem::path> &path, bool verbose)
    {
        std::vector<spdlog::sink_ptr> sinks;
        if (path)
        {
            try
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), false));
            }
            catch (const spdlog::spdlog_ex &ex)
            {
                std::cerr << "[warning] cannot open log file " << path->string() << ": " << ex.what() << std::endl;
            }
        }
        if (verbose)
        {
            auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console->set_level(spdlog::level::debug);
            sinks.push_back(std::move(console));
        }
        if (sinks.empty())
        {
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
        }
        logger_ = std::make_shared<spdlog::logger>("nimbus", sinks.begin(), sinks.end());
        logger_->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] [t%t] %v");
        logger_->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
        logger_->flush_on(spdlog::level::warn);
    }

} // namespace nimbus::client
