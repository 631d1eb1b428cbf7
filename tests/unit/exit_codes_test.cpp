#include <catch2/catch.hpp>

#include <cstdlib>

#include "config/exit_codes.h"
#include "core/session/download_session.h"
#include "core/shutdown/shutdown_coordinator.h"
#include "source/dump_directory_source.h"
#include "storage/archive/archive_reader.h"
#include "storage/archive/archive_writer.h"
#include "tests/common/test_utils.h"

namespace
{
    using namespace chatarc;
    using namespace chatarc::config;
    using namespace chatarc::core;
    using namespace chatarc::test;

    // Runs one session over the dump directory, as the chatarc binary does.
    int RunArchiver(const std::string &dump_dir, ChannelId channel, const std::string &out_path,
                    ShutdownCoordinator *shutdown)
    {
        ArchiveOptions opt;
        opt.path = out_path;
        opt.batch_size = 2;
        opt.compression_level = 1;
        source::DumpDirectorySource src(dump_dir);
        DownloadSession session(&src, channel, opt, shutdown);
        SessionReport report;
        return ExitCodeFor(session.Run(&report));
    }

    int RunVerify(const std::string &path)
    {
        storage::VerifyReport report;
        Status st = storage::ArchiveReader::Verify(path, &report);
        return VerifyExitCode(st, report);
    }

    const char *kDump = "#guild\tgeneral\n1\talice\thi\n2\tbob\tyo\n3\talice\tbye\n";
}

TEST_CASE("Status maps to the archiver exit code", "[exit]")
{
    REQUIRE(ExitCodeFor(Status::Ok()) == 0);
    REQUIRE(ExitCodeFor(Status::ChannelNotFound()) == 1);
    REQUIRE(ExitCodeFor(Status::FormatError("bad magic")) == 2);
    REQUIRE(ExitCodeFor(Status::IOError("disk full")) == 2);
    REQUIRE(ExitCodeFor(Status::TransportError("reset")) == 2);
    REQUIRE(ExitCodeFor(Status::InvalidArgument("batch")) == 2);
    REQUIRE(ExitCodeFor(Status::Internal("zstd")) == 2);
}

TEST_CASE("Verify result maps to the verify tool exit code", "[exit]")
{
    storage::VerifyReport report;
    report.reconciled = true;
    REQUIRE(VerifyExitCode(Status::Ok(), report) == 0);
    report.reconciled = false;
    REQUIRE(VerifyExitCode(Status::Ok(), report) == 1);
    report.reconciled = true;
    REQUIRE(VerifyExitCode(Status::FormatError("torn chunk"), report) == 2);
}

TEST_CASE("Archiver exits 1 for an unknown channel and 0 on completion", "[exit][source]")
{
    TempDir dir;
    WriteFileBytes(dir.file("10.tsv"), kDump);
    const std::string out = dir.file("general.zst");

    ShutdownCoordinator shutdown;
    REQUIRE(RunArchiver(dir.str(), 99, out, &shutdown) == kExitChannelNotFound);

    ShutdownCoordinator again;
    REQUIRE(RunArchiver(dir.str(), 10, out, &again) == kExitOk);
    REQUIRE(RunVerify(out) == kExitOk);
}

TEST_CASE("Archiver exits 0 on a graceful stop", "[exit][shutdown]")
{
    TempDir dir;
    WriteFileBytes(dir.file("10.tsv"), kDump);

    ShutdownCoordinator shutdown;
    shutdown.RequestShutdown();
    REQUIRE(RunArchiver(dir.str(), 10, dir.file("general.zst"), &shutdown) == kExitOk);
}

TEST_CASE("Archiver exits 2 on a malformed dump or a foreign archive file", "[exit]")
{
    TempDir dir;
    ShutdownCoordinator shutdown;

    SECTION("malformed dump")
    {
        WriteFileBytes(dir.file("10.tsv"), "#guild\tgeneral\nnot-an-id\talice\thi\n");
        REQUIRE(RunArchiver(dir.str(), 10, dir.file("general.zst"), &shutdown) == kExitError);
    }
    SECTION("foreign file at the archive path")
    {
        WriteFileBytes(dir.file("10.tsv"), kDump);
        WriteFileBytes(dir.file("general.zst"), "plain text, not an archive");
        REQUIRE(RunArchiver(dir.str(), 10, dir.file("general.zst"), &shutdown) == kExitError);
        REQUIRE(RunVerify(dir.file("general.zst")) == kExitError);
    }
}

TEST_CASE("Verify exits 1 after a commit lost its chunk", "[exit][crash]")
{
    TempDir dir;
    WriteFileBytes(dir.file("10.tsv"), kDump);
    const std::string out = dir.file("general.zst");

    ::setenv("CHATARC_FAILPOINT", storage::ArchiveWriter::kFailAfterMetadata, 1);
    ShutdownCoordinator shutdown;
    const int code = RunArchiver(dir.str(), 10, out, &shutdown);
    ::unsetenv("CHATARC_FAILPOINT");

    REQUIRE(code == kExitError);
    REQUIRE(RunVerify(out) == kExitNotReconciled);
    REQUIRE(RunVerify(dir.file("missing.zst")) == kExitError);
}
