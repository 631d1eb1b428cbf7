#include "config/archiver_config.h"

#include <charconv>
#include <fstream>

#include "util/logging.h"

namespace chatarc::config
{

    static std::string Trim(const std::string &s)
    {
        std::size_t a = 0;
        while (a < s.size() && (s[a] == ' ' || s[a] == '\t'))
            ++a;
        std::size_t b = s.size();
        while (b > a && (s[b - 1] == ' ' || s[b - 1] == '\t' || s[b - 1] == '\r'))
            --b;
        return s.substr(a, b - a);
    }

    template <typename T>
    static chatarc::Status ParseNumber(std::string_view key, std::string_view val, T *out)
    {
        T v{};
        auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), v);
        if (val.empty() || ec != std::errc() || ptr != val.data() + val.size())
            return chatarc::Status::InvalidArgument(std::string(key) + ": not a number: " + std::string(val));
        *out = v;
        return chatarc::Status::Ok();
    }

    chatarc::ArchiveOptions ArchiverConfig::ToArchiveOptions() const
    {
        chatarc::ArchiveOptions opt;
        opt.path = path;
        opt.batch_size = batch_size;
        opt.compression_level = compression_level;
        opt.fsync = fsync;
        return opt;
    }

    chatarc::Status ApplySetting(std::string_view key, std::string_view val, ArchiverConfig *cfg)
    {
        if (key == "token")
            cfg->token = val;
        else if (key == "channel")
            return ParseNumber(key, val, &cfg->channel);
        else if (key == "path")
            cfg->path = val;
        else if (key == "batch")
        {
            std::size_t n = 0;
            auto st = ParseNumber(key, val, &n);
            if (!st.ok())
                return st;
            if (n == 0)
                return chatarc::Status::InvalidArgument("batch: must be at least 1");
            cfg->batch_size = n;
        }
        else if (key == "source")
            cfg->source_dir = val;
        else if (key == "level")
            return ParseNumber(key, val, &cfg->compression_level);
        else if (key == "fsync")
        {
            if (val == "always")
                cfg->fsync = chatarc::FsyncPolicy::kAlways;
            else if (val == "never")
                cfg->fsync = chatarc::FsyncPolicy::kNever;
            else
                return chatarc::Status::InvalidArgument("fsync: expected always|never");
        }
        else if (key == "log_path")
            cfg->log_path = val;
        else if (key == "log_level")
        {
            chatarc::util::LogLevel lvl;
            if (!chatarc::util::ParseLogLevel(val, &lvl))
                return chatarc::Status::InvalidArgument("log_level: expected debug|info|warn|error");
            cfg->log_level = val;
        }
        else
            return chatarc::Status::NotFound("unknown setting: " + std::string(key));
        return chatarc::Status::Ok();
    }

    chatarc::Status LoadConfigFile(const std::string &path, ArchiverConfig *cfg)
    {
        std::ifstream in(path);
        if (!in)
            return chatarc::Status::Ok();

        std::string line;
        std::size_t lineno = 0;
        while (std::getline(in, line))
        {
            ++lineno;
            line = Trim(line);
            if (line.empty() || line[0] == '#')
                continue;

            auto pos = line.find(':');
            if (pos == std::string::npos)
                continue;

            std::string key = Trim(line.substr(0, pos));
            std::string val = Trim(line.substr(pos + 1));

            if (!val.empty() && val.front() == '"' && val.back() == '"' && val.size() >= 2)
            {
                val = val.substr(1, val.size() - 2);
            }

            auto st = ApplySetting(key, val, cfg);
            if (st.IsNotFound())
            {
                CHATARC_LOG_WARN(path, ":", lineno, ": ignoring unknown key '", key, "'");
                continue;
            }
            if (!st.ok())
                return chatarc::Status::InvalidArgument(path + ":" + std::to_string(lineno) + ": " + st.message());
        }

        return chatarc::Status::Ok();
    }

}
