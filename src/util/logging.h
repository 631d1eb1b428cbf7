#pragma once

#include <mutex>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>

namespace chatarc::util
{
    enum class LogLevel
    {
        kDebug,
        kInfo,
        kWarn,
        kError
    };

    // Parses DEBUG/INFO/WARN/ERROR (case-insensitive). Returns false on anything else.
    bool ParseLogLevel(std::string_view s, LogLevel *out);

    /**
     * @brief Process-wide logger for chatarc.
     * Use CHATARC_LOG_* macros for automatic file/line capture. Arguments are
     * streamed in order, so `CHATARC_LOG_INFO("total=", n)` needs no format string.
     */
    class Logger
    {
    public:
        static Logger& Instance();

        void SetLevel(LogLevel level);
        LogLevel GetLevel() const;

        // Appends to `path` instead of stderr. Empty path restores stderr.
        void SetFile(std::string path);

        template <typename... Args>
        void Log(LogLevel level, std::source_location loc, Args&&... args)
        {
            if (level < min_level_) return;

            std::ostringstream os;
            (os << ... << std::forward<Args>(args));
            Write(level, loc, os.str());
        }

    private:
        Logger();
        void Write(LogLevel level, std::source_location loc, const std::string& message);

        LogLevel min_level_;
        std::string file_path_;
        std::mutex mutex_;
    };

} // namespace chatarc::util

// ── Macros ──────────────────────────────────────────────────────────────────

#define CHATARC_LOG_DEBUG(...) \
    ::chatarc::util::Logger::Instance().Log(::chatarc::util::LogLevel::kDebug, std::source_location::current(), __VA_ARGS__)

#define CHATARC_LOG_INFO(...) \
    ::chatarc::util::Logger::Instance().Log(::chatarc::util::LogLevel::kInfo, std::source_location::current(), __VA_ARGS__)

#define CHATARC_LOG_WARN(...) \
    ::chatarc::util::Logger::Instance().Log(::chatarc::util::LogLevel::kWarn, std::source_location::current(), __VA_ARGS__)

#define CHATARC_LOG_ERROR(...) \
    ::chatarc::util::Logger::Instance().Log(::chatarc::util::LogLevel::kError, std::source_location::current(), __VA_ARGS__)
