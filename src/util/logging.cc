#include "util/logging.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>

namespace chatarc::util
{
    bool ParseLogLevel(std::string_view s, LogLevel *out)
    {
        std::string up(s);
        std::transform(up.begin(), up.end(), up.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (up == "DEBUG") *out = LogLevel::kDebug;
        else if (up == "INFO") *out = LogLevel::kInfo;
        else if (up == "WARN") *out = LogLevel::kWarn;
        else if (up == "ERROR") *out = LogLevel::kError;
        else return false;
        return true;
    }

    Logger::Logger() : min_level_(LogLevel::kInfo)
    {
        const char* env = std::getenv("CHATARC_LOG_LEVEL");
        if (env) {
            LogLevel lvl;
            if (ParseLogLevel(env, &lvl)) min_level_ = lvl;
        }
    }

    Logger& Logger::Instance()
    {
        static Logger instance;
        return instance;
    }

    void Logger::SetLevel(LogLevel level)
    {
        min_level_ = level;
    }

    LogLevel Logger::GetLevel() const
    {
        return min_level_;
    }

    void Logger::SetFile(std::string path)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        file_path_ = std::move(path);
    }

    void Logger::Write(LogLevel level, std::source_location loc, const std::string& message)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto now = std::chrono::system_clock::now();
        auto in_time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
        std::tm tm_buf{};
        localtime_r(&in_time_t, &tm_buf);

        const char* level_str = "";
        switch (level)
        {
            case LogLevel::kDebug: level_str = "DEBUG"; break;
            case LogLevel::kInfo:  level_str = "INFO "; break;
            case LogLevel::kWarn:  level_str = "WARN "; break;
            case LogLevel::kError: level_str = "ERROR"; break;
        }

        std::ostringstream line;
        line << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
             << "." << std::setfill('0') << std::setw(3) << ms.count() << "] "
             << level_str << " "
             << "[" << std::filesystem::path(loc.file_name()).filename().string() << ":" << loc.line() << "] "
             << message << "\n";

        if (!file_path_.empty())
        {
            std::ofstream out(file_path_, std::ios::app);
            if (out)
            {
                out << line.str();
                return;
            }
        }
        std::cerr << line.str();
    }

} // namespace chatarc::util
