#include "storage/archive/archive_writer.h"

#include <filesystem>

#include "storage/frame/metadata_frame.h"
#include "util/failpoint.h"
#include "util/posix_file.h"

namespace fs = std::filesystem;

namespace chatarc::storage
{

    ArchiveWriter::ArchiveWriter(std::string path, chatarc::FsyncPolicy fsync)
        : path_(std::move(path)), fsync_(fsync) {}

    chatarc::Status ArchiveWriter::EnsureInitialized(bool *created)
    {
        *created = false;
        std::error_code ec;
        const bool exists = fs::exists(path_, ec);
        if (ec)
            return chatarc::Status::IOError("stat " + path_ + ": " + ec.message());
        if (exists)
            return chatarc::Status::Ok();

        auto st = MetadataFrame::Initialize(path_, fsync_);
        if (!st.ok())
            return st;
        *created = true;
        return chatarc::Status::Ok();
    }

    chatarc::Status ArchiveWriter::Load(chatarc::ArchiveCounters *out)
    {
        auto st = MetadataFrame::Read(path_, &counters_);
        if (!st.ok())
            return st;
        loaded_ = true;
        if (out)
            *out = counters_;
        return chatarc::Status::Ok();
    }

    chatarc::ArchiveCounters ArchiveWriter::Advance(const chatarc::ArchiveCounters &current,
                                                    const EncodedBatch &batch)
    {
        chatarc::ArchiveCounters next;
        next.last_committed_message_id = batch.last_message_id;
        next.total_messages_committed = current.total_messages_committed + batch.message_count;
        next.total_uncompressed_bytes_committed =
            current.total_uncompressed_bytes_committed + batch.transcript_len;
        return next;
    }

    chatarc::Status ArchiveWriter::Commit(const EncodedBatch &batch)
    {
        if (!loaded_)
            return chatarc::Status::InvalidArgument("commit before Load()");
        if (batch.message_count == 0)
            return chatarc::Status::InvalidArgument("commit of an empty batch");
        if (batch.last_message_id <= counters_.last_committed_message_id)
            return chatarc::Status::InvalidArgument("batch does not advance the cursor");

        const chatarc::ArchiveCounters next = Advance(counters_, batch);

        auto st = MetadataFrame::Overwrite(path_, next, fsync_);
        if (!st.ok())
            return st;

        if (chatarc::util::FailpointHit(kFailAfterMetadata))
            return chatarc::Status::IOError("failpoint commit_after_metadata");

        st = AppendChunk(batch);
        if (!st.ok())
            return st;

        counters_ = next;
        return chatarc::Status::Ok();
    }

    chatarc::Status ArchiveWriter::AppendChunk(const EncodedBatch &batch)
    {
        chatarc::util::PosixFile f;
        auto st = chatarc::util::PosixFile::OpenAppend(path_, &f);
        if (!st.ok())
            return st;

        st = f.Append(batch.compressed_chunk.data(), batch.compressed_chunk.size());
        if (!st.ok())
            return st;

        if (fsync_ == chatarc::FsyncPolicy::kAlways)
        {
            st = f.SyncData();
            if (!st.ok())
                return st;
        }
        return f.Close();
    }

} // namespace chatarc::storage
