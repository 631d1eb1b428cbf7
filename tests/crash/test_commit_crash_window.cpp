#include <catch2/catch.hpp>

#include <cstdlib>

#include "storage/archive/archive_reader.h"
#include "storage/archive/archive_writer.h"
#include "storage/batch/batch_encoder.h"
#include "storage/frame/metadata_frame.h"
#include "tests/common/test_utils.h"

namespace
{
    using namespace chatarc;
    using namespace chatarc::storage;
    using namespace chatarc::test;

    struct ScopedFailpoint
    {
        explicit ScopedFailpoint(const char *name) { ::setenv("CHATARC_FAILPOINT", name, 1); }
        ~ScopedFailpoint() { ::unsetenv("CHATARC_FAILPOINT"); }
    };

    EncodedBatch Encode(const std::vector<Message> &msgs)
    {
        BatchEncoder enc(3);
        EncodedBatch out;
        REQUIRE(enc.Encode(msgs, &out).ok());
        return out;
    }
}

TEST_CASE("Crash between metadata update and append loses the batch bytes", "[crash][archive]")
{
    TempDir dir;
    const std::string path = dir.file("general.zst");

    auto first = MakeMessages(3, 1);
    auto second = MakeMessages(3, 4);
    const auto b1 = Encode(first);
    const auto b2 = Encode(second);

    {
        ArchiveWriter w(path, FsyncPolicy::kNever);
        bool created = false;
        REQUIRE(w.EnsureInitialized(&created).ok());
        REQUIRE(w.Load(nullptr).ok());
        REQUIRE(w.Commit(b1).ok());

        ScopedFailpoint fp(ArchiveWriter::kFailAfterMetadata);
        REQUIRE_FALSE(w.Commit(b2).ok());
    }

    // The frame claims both batches; only the first one's bytes exist.
    ArchiveCounters c;
    REQUIRE(MetadataFrame::Read(path, &c).ok());
    REQUIRE(c.last_committed_message_id == 6);
    REQUIRE(c.total_messages_committed == 6);
    REQUIRE(c.total_uncompressed_bytes_committed == b1.transcript_len + b2.transcript_len);
    REQUIRE(ReadFileBytes(path).size() == kFrameSize + b1.compressed_chunk.size());

    VerifyReport report;
    REQUIRE(ArchiveReader::Verify(path, &report).ok());
    REQUIRE_FALSE(report.reconciled);
    REQUIRE(report.decoded_bytes == b1.transcript_len);

    // A resumed writer continues after message 6; messages 4..6 are gone.
    ArchiveWriter resumed(path, FsyncPolicy::kNever);
    REQUIRE(resumed.Load(&c).ok());
    REQUIRE(c.last_committed_message_id == 6);
    auto third = MakeMessages(2, 7);
    REQUIRE(resumed.Commit(Encode(third)).ok());

    std::string transcript;
    REQUIRE(ArchiveReader::ReadTranscript(path, &transcript).ok());
    REQUIRE(transcript == BatchEncoder::BuildTranscript(first) + BatchEncoder::BuildTranscript(third));
    REQUIRE(transcript.find("message #5") == std::string::npos);
}

TEST_CASE("A torn final chunk is reported as FormatError", "[crash][archive]")
{
    TempDir dir;
    const std::string path = dir.file("general.zst");
    ArchiveWriter w(path, FsyncPolicy::kNever);
    bool created = false;
    REQUIRE(w.EnsureInitialized(&created).ok());
    REQUIRE(w.Load(nullptr).ok());
    REQUIRE(w.Commit(Encode(MakeMessages(50, 1))).ok());

    std::string bytes = ReadFileBytes(path);
    WriteFileBytes(path, bytes.substr(0, bytes.size() - 5));

    VerifyReport report;
    REQUIRE(ArchiveReader::Verify(path, &report).IsFormatError());

    // The frame itself is still readable, so resume remains possible.
    ArchiveCounters c;
    REQUIRE(MetadataFrame::Read(path, &c).ok());
    REQUIRE(c.total_messages_committed == 50);
}
