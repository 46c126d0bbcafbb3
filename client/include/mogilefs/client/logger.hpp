#pragma once

#include <cstdint>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace mogilefs::client
{

    // Component a log line is attributed to, rendered as its bracketed tag.
    enum class LogSource : std::uint8_t
    {
        Client,
        Tracker,
        Storage,
        Write,
        Read,
    };

    std::string_view to_string(LogSource source) noexcept;

    struct LogSettings
    {
        std::optional<std::filesystem::path> file;
        spdlog::level::level_enum level{spdlog::level::info};
    };

    // Parses "trace", "debug", "info", "warn", "error" or "off".
    std::optional<spdlog::level::level_enum> parse_log_level(std::string_view text);

    /**
     * Injected logging capability.
     *
     * Copies share one spdlog logger. Without a file the logger discards everything.
     * Failures are reported at warn so a file opened at "warn" holds only the trouble.
     */
    class Logger
    {
    public:
        Logger();
        explicit Logger(const LogSettings &settings);
        explicit Logger(std::shared_ptr<spdlog::logger> logger);

        template <typename... Args>
        void debug(LogSource source, Args &&...args) const
        {
            write(spdlog::level::debug, source, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void info(LogSource source, Args &&...args) const
        {
            write(spdlog::level::info, source, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void warn(LogSource source, Args &&...args) const
        {
            write(spdlog::level::warn, source, std::forward<Args>(args)...);
        }

    private:
        template <typename... Args>
        void write(spdlog::level::level_enum level, LogSource source, Args &&...args) const
        {
            if (!logger_ || !logger_->should_log(level))
            {
                return;
            }
            spdlog::fmt_lib::memory_buffer buf;
            (spdlog::fmt_lib::format_to(std::back_inserter(buf), "{}", std::forward<Args>(args)), ...);
            logger_->log(level, "[{}] {}", to_string(source), std::string_view(buf.data(), buf.size()));
        }

        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace mogilefs::client
