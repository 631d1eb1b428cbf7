#include <catch2/catch.hpp>

#include <cstdint>
#include <filesystem>
#include <limits>

#include "storage/frame/metadata_frame.h"
#include "tests/common/test_utils.h"

namespace
{
    using namespace chatarc;
    using namespace chatarc::storage;
    using namespace chatarc::test;
}

TEST_CASE("Initialize writes a zeroed skippable frame", "[storage][frame]")
{
    TempDir dir;
    const std::string path = dir.file("a.zst");

    REQUIRE(MetadataFrame::Initialize(path).ok());

    const std::string bytes = ReadFileBytes(path);
    REQUIRE(bytes.size() == kFrameSize);
    REQUIRE(static_cast<std::uint8_t>(bytes[0]) == 0x50);
    REQUIRE(static_cast<std::uint8_t>(bytes[1]) == 0x2A);
    REQUIRE(static_cast<std::uint8_t>(bytes[2]) == 0x4D);
    REQUIRE(static_cast<std::uint8_t>(bytes[3]) == 0x18);
    REQUIRE(static_cast<std::uint8_t>(bytes[4]) == 24);
    for (std::size_t i = 5; i < kFrameSize; ++i)
        REQUIRE(bytes[i] == 0);

    ArchiveCounters c;
    REQUIRE(MetadataFrame::Read(path, &c).ok());
    REQUIRE(c == ArchiveCounters{});
}

TEST_CASE("Initialize refuses an existing path", "[storage][frame]")
{
    TempDir dir;
    const std::string path = dir.file("a.zst");
    WriteFileBytes(path, "keep me");

    Status st = MetadataFrame::Initialize(path);
    REQUIRE(st.IsAlreadyExists());
    REQUIRE(ReadFileBytes(path) == "keep me");
}

TEST_CASE("Initialize reports IOError when the directory is missing", "[storage][frame]")
{
    TempDir dir;
    Status st = MetadataFrame::Initialize(dir.file("missing/sub/a.zst"));
    REQUIRE(st.code() == ErrorCode::kIO);
}

TEST_CASE("Overwrite then Read round-trips counters", "[storage][frame]")
{
    TempDir dir;
    const std::string path = dir.file("a.zst");
    REQUIRE(MetadataFrame::Initialize(path).ok());

    constexpr auto kMax = std::numeric_limits<std::uint64_t>::max();
    const ArchiveCounters cases[] = {
        {0, 0, 0},
        {1, 1, 1},
        {1099511627776ULL + 7, 140, 5123},
        {kMax, kMax, kMax},
        {0x0102030405060708ULL, 0x8877665544332211ULL, 0x00FF00FF00FF00FFULL},
    };
    for (const auto &want : cases)
    {
        REQUIRE(MetadataFrame::Overwrite(path, want).ok());
        ArchiveCounters got;
        REQUIRE(MetadataFrame::Read(path, &got).ok());
        REQUIRE(got == want);
    }
}

TEST_CASE("Counters are stored little-endian", "[storage][frame]")
{
    TempDir dir;
    const std::string path = dir.file("a.zst");
    REQUIRE(MetadataFrame::Initialize(path).ok());
    REQUIRE(MetadataFrame::Overwrite(path, {0x0102030405060708ULL, 2, 3}).ok());

    const std::string bytes = ReadFileBytes(path);
    REQUIRE(static_cast<std::uint8_t>(bytes[8]) == 0x08);
    REQUIRE(static_cast<std::uint8_t>(bytes[15]) == 0x01);
    REQUIRE(static_cast<std::uint8_t>(bytes[16]) == 2);
    REQUIRE(static_cast<std::uint8_t>(bytes[24]) == 3);
}

TEST_CASE("Overwrite never changes the file length or the batch region", "[storage][frame]")
{
    TempDir dir;
    const std::string path = dir.file("a.zst");
    REQUIRE(MetadataFrame::Initialize(path).ok());

    std::string bytes = ReadFileBytes(path);
    const std::string tail = "batch-region-bytes";
    WriteFileBytes(path, bytes + tail);

    REQUIRE(MetadataFrame::Overwrite(path, {9, 10, 11}).ok());

    const std::string after = ReadFileBytes(path);
    REQUIRE(after.size() == kFrameSize + tail.size());
    REQUIRE(after.substr(kFrameSize) == tail);
    REQUIRE(after.substr(0, 8) == bytes.substr(0, 8));
}

TEST_CASE("Foreign or damaged headers are FormatError", "[storage][frame]")
{
    TempDir dir;
    const std::string path = dir.file("a.zst");
    REQUIRE(MetadataFrame::Initialize(path).ok());
    const std::string good = ReadFileBytes(path);
    ArchiveCounters c;

    SECTION("wrong magic")
    {
        std::string bad = good;
        bad[0] = 0x28; // regular zstd frame magic starts 28 B5 2F FD
        WriteFileBytes(path, bad);
        REQUIRE(MetadataFrame::Read(path, &c).IsFormatError());
        REQUIRE(MetadataFrame::Overwrite(path, {1, 1, 1}).IsFormatError());
        REQUIRE(ReadFileBytes(path) == bad);
    }

    SECTION("wrong declared length")
    {
        std::string bad = good;
        bad[4] = 16;
        WriteFileBytes(path, bad);
        REQUIRE(MetadataFrame::Read(path, &c).IsFormatError());
        REQUIRE(MetadataFrame::Overwrite(path, {1, 1, 1}).IsFormatError());
    }

    SECTION("truncated file")
    {
        WriteFileBytes(path, good.substr(0, 20));
        REQUIRE(MetadataFrame::Read(path, &c).IsFormatError());
        REQUIRE(MetadataFrame::Overwrite(path, {1, 1, 1}).IsFormatError());
        REQUIRE(ReadFileBytes(path).size() == 20);
    }

    SECTION("empty file")
    {
        WriteFileBytes(path, "");
        REQUIRE(MetadataFrame::Read(path, &c).IsFormatError());
    }
}

TEST_CASE("Read of a missing archive is IOError", "[storage][frame]")
{
    TempDir dir;
    ArchiveCounters c;
    REQUIRE(MetadataFrame::Read(dir.file("none.zst"), &c).code() == ErrorCode::kIO);
}
