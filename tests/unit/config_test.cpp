#include <catch2/catch.hpp>

#include "config/archiver_config.h"
#include "tests/common/test_utils.h"

using namespace chatarc;
using chatarc::config::ApplySetting;
using chatarc::config::ArchiverConfig;
using chatarc::config::LoadConfigFile;
using chatarc::test::TempDir;
using chatarc::test::WriteFileBytes;

TEST_CASE("Defaults match the archive format defaults", "[config]")
{
    ArchiverConfig cfg;
    REQUIRE(cfg.batch_size == 100);
    REQUIRE(cfg.compression_level == 22);
    REQUIRE(cfg.fsync == FsyncPolicy::kNever);
    REQUIRE(cfg.path.empty());

    ArchiveOptions opt = cfg.ToArchiveOptions();
    REQUIRE(opt.batch_size == 100);
    REQUIRE(opt.compression_level == 22);
}

TEST_CASE("Missing config file keeps defaults", "[config]")
{
    TempDir dir;
    ArchiverConfig cfg;
    REQUIRE(LoadConfigFile(dir.file("absent.conf"), &cfg).ok());
    REQUIRE(cfg.batch_size == 100);
}

TEST_CASE("Config file sets every known key", "[config]")
{
    TempDir dir;
    WriteFileBytes(dir.file("chatarc.conf"),
                   "# archiver settings\n"
                   "token: \"abc def\"\n"
                   "channel: 123456789012345678\n"
                   "path: /tmp/out.zst\n"
                   "batch: 50\n"
                   "\n"
                   "source:   ./dumps  \r\n"
                   "level: 3\n"
                   "fsync: always\n"
                   "log_path: run.log\n"
                   "log_level: debug\n"
                   "colour: blue\n"
                   "no separator here\n");

    ArchiverConfig cfg;
    REQUIRE(LoadConfigFile(dir.file("chatarc.conf"), &cfg).ok());
    REQUIRE(cfg.token == "abc def");
    REQUIRE(cfg.channel == 123456789012345678ull);
    REQUIRE(cfg.path == "/tmp/out.zst");
    REQUIRE(cfg.batch_size == 50);
    REQUIRE(cfg.source_dir == "./dumps");
    REQUIRE(cfg.compression_level == 3);
    REQUIRE(cfg.fsync == FsyncPolicy::kAlways);
    REQUIRE(cfg.log_path == "run.log");
    REQUIRE(cfg.log_level == "debug");
}

TEST_CASE("Bad values report file and line", "[config]")
{
    TempDir dir;
    const std::string path = dir.file("bad.conf");
    WriteFileBytes(path, "batch: 10\nbatch: 0\n");

    ArchiverConfig cfg;
    Status st = LoadConfigFile(path, &cfg);
    REQUIRE(st.code() == ErrorCode::kInvalidArgument);
    REQUIRE(st.message().find(path + ":2:") == 0);
    REQUIRE(cfg.batch_size == 10);
}

TEST_CASE("ApplySetting validates each value", "[config]")
{
    ArchiverConfig cfg;
    REQUIRE(ApplySetting("channel", "12x", &cfg).code() == ErrorCode::kInvalidArgument);
    REQUIRE(ApplySetting("channel", "", &cfg).code() == ErrorCode::kInvalidArgument);
    REQUIRE(ApplySetting("channel", "-1", &cfg).code() == ErrorCode::kInvalidArgument);
    REQUIRE(ApplySetting("level", "-5", &cfg).ok());
    REQUIRE(cfg.compression_level == -5);
    REQUIRE(ApplySetting("fsync", "sometimes", &cfg).code() == ErrorCode::kInvalidArgument);
    REQUIRE(ApplySetting("fsync", "never", &cfg).ok());
    REQUIRE(ApplySetting("log_level", "loud", &cfg).code() == ErrorCode::kInvalidArgument);
    REQUIRE(ApplySetting("nonsense", "1", &cfg).IsNotFound());
}
