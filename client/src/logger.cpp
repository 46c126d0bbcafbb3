#include "mogilefs/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <array>

namespace mogilefs::client
{

    namespace
    {

        struct LogSourceMapping
        {
            LogSource source;
            std::string_view tag;
        };

        constexpr std::array<LogSourceMapping, 5> kLogSourceMappings{{
            {LogSource::Client, "client"},
            {LogSource::Tracker, "tracker"},
            {LogSource::Storage, "storage"},
            {LogSource::Write, "write"},
            {LogSource::Read, "read"},
        }};

        struct LogLevelMapping
        {
            std::string_view name;
            spdlog::level::level_enum level;
        };

        constexpr std::array<LogLevelMapping, 6> kLogLevelMappings{{
            {"trace", spdlog::level::trace},
            {"debug", spdlog::level::debug},
            {"info", spdlog::level::info},
            {"warn", spdlog::level::warn},
            {"error", spdlog::level::err},
            {"off", spdlog::level::off},
        }};

    } // namespace

    std::string_view to_string(LogSource source) noexcept
    {
        for (const auto &mapping : kLogSourceMappings)
        {
            if (mapping.source == source)
            {
                return mapping.tag;
            }
        }
        return "unknown";
    }

    std::optional<spdlog::level::level_enum> parse_log_level(std::string_view text)
    {
        for (const auto &mapping : kLogLevelMappings)
        {
            if (mapping.name == text)
            {
                return mapping.level;
            }
        }
        return std::nullopt;
    }

    Logger::Logger()
        : logger_(std::make_shared<spdlog::logger>("mogilefs", std::make_shared<spdlog::sinks::null_sink_mt>()))
    {
        logger_->set_level(spdlog::level::off);
    }

    Logger::Logger(const LogSettings &settings)
        : Logger()
    {
        if (!settings.file || settings.level == spdlog::level::off)
        {
            return;
        }
        try
        {
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.file->string(), false);
            logger_ = std::make_shared<spdlog::logger>("mogilefs", std::move(sink));
            logger_->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] %v");
            logger_->set_level(settings.level);
            logger_->flush_on(spdlog::level::warn);
        }
        catch (const spdlog::spdlog_ex &)
        {
            // Unwritable log file: keep the discarding logger from the delegated constructor.
        }
    }

    Logger::Logger(std::shared_ptr<spdlog::logger> logger)
        : logger_(std::move(logger))
    {
    }

} // namespace mogilefs::client
