// chatarc: incrementally archives a channel's history into one .zst file.
//
// Signal handling follows the usual pattern: the SIGINT/SIGTERM handler only
// flips flags on the ShutdownCoordinator, and the download session decides
// when it is safe to stop (never in the middle of a commit).

#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "chatarc/status.h"
#include "config/archiver_config.h"
#include "config/exit_codes.h"
#include "core/session/download_session.h"
#include "core/shutdown/shutdown_coordinator.h"
#include "source/dump_directory_source.h"
#include "util/logging.h"

namespace
{
    void PrintUsage(const char *argv0)
    {
        std::cerr << "Usage: " << argv0 << " --channel <id> [options]\n"
                  << "  --token <token>       auth token for the history source\n"
                  << "  --channel <id>        channel to archive\n"
                  << "  --path <file>         archive path (default: <channel name>.zst)\n"
                  << "  --batch <n>           messages per batch (default: 100)\n"
                  << "  --source <dir>        directory holding <channel>.tsv dumps (default: .)\n"
                  << "  --level <n>           zstd compression level (default: 22)\n"
                  << "  --fsync always|never  fdatasync after each commit step\n"
                  << "  --log-file <file>     append log lines to a file\n"
                  << "  --log-level <level>   debug|info|warn|error\n"
                  << "  --config <file>       key: value config file, overridden by flags\n";
    }

    // Maps a command-line flag to its config key.
    const char *FlagKey(std::string_view flag)
    {
        if (flag == "--token") return "token";
        if (flag == "--channel") return "channel";
        if (flag == "--path") return "path";
        if (flag == "--batch") return "batch";
        if (flag == "--source") return "source";
        if (flag == "--level") return "level";
        if (flag == "--fsync") return "fsync";
        if (flag == "--log-file") return "log_path";
        if (flag == "--log-level") return "log_level";
        return nullptr;
    }
} // namespace

int main(int argc, char **argv)
{
    std::string cfg_path;
    std::vector<std::pair<std::string, std::string>> overrides;
    bool channel_given = false;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            PrintUsage(argv[0]);
            return 0;
        }
        if (i + 1 >= argc)
        {
            std::cerr << "missing value for " << arg << "\n";
            PrintUsage(argv[0]);
            return chatarc::config::kExitError;
        }
        if (arg == "--config" || arg == "-c")
        {
            cfg_path = argv[++i];
            continue;
        }
        const char *key = FlagKey(arg);
        if (!key)
        {
            std::cerr << "unknown option " << arg << "\n";
            PrintUsage(argv[0]);
            return chatarc::config::kExitError;
        }
        if (arg == "--channel")
            channel_given = true;
        overrides.emplace_back(key, argv[++i]);
    }

    chatarc::config::ArchiverConfig cfg;
    if (!cfg_path.empty())
    {
        auto st = chatarc::config::LoadConfigFile(cfg_path, &cfg);
        if (!st.ok())
        {
            std::cerr << st.ToString() << "\n";
            return chatarc::config::kExitError;
        }
        channel_given = channel_given || cfg.channel != 0;
    }
    for (const auto &[key, value] : overrides)
    {
        auto st = chatarc::config::ApplySetting(key, value, &cfg);
        if (!st.ok())
        {
            std::cerr << st.ToString() << "\n";
            return chatarc::config::kExitError;
        }
    }
    if (!channel_given)
    {
        PrintUsage(argv[0]);
        return chatarc::config::kExitError;
    }

    auto &logger = chatarc::util::Logger::Instance();
    chatarc::util::LogLevel lvl;
    if (chatarc::util::ParseLogLevel(cfg.log_level, &lvl))
        logger.SetLevel(lvl);
    if (!cfg.log_path.empty())
        logger.SetFile(cfg.log_path);

    // Both flags start cleared for this session.
    chatarc::core::ShutdownCoordinator shutdown;
    auto st = chatarc::core::ShutdownCoordinator::InstallSignalHandlers(&shutdown);
    if (!st.ok())
    {
        CHATARC_LOG_ERROR("cannot install signal handlers: ", st.ToString());
        return chatarc::config::kExitError;
    }

    // Authentication belongs to the history source; the dump source needs none.
    if (!cfg.token.empty())
        CHATARC_LOG_DEBUG("auth token supplied (", cfg.token.size(), " bytes)");

    chatarc::source::DumpDirectorySource source(cfg.source_dir);
    chatarc::core::DownloadSession session(&source, cfg.channel, cfg.ToArchiveOptions(), &shutdown);

    chatarc::core::SessionReport report;
    st = session.Run(&report);

    auto unst = chatarc::core::ShutdownCoordinator::UninstallSignalHandlers();
    if (!unst.ok())
        CHATARC_LOG_WARN("restoring signal handlers: ", unst.ToString());

    const int code = chatarc::config::ExitCodeFor(st);
    if (code == chatarc::config::kExitChannelNotFound)
        CHATARC_LOG_ERROR("channel not found.");
    return code;
}
