#include "storage/frame/metadata_frame.h"

#include <cstring>
#include <filesystem>

#include "util/posix_file.h"

namespace chatarc::storage
{
    namespace
    {
        void PutU32(std::uint8_t *dst, std::uint32_t v)
        {
            for (int i = 0; i < 4; ++i)
                dst[i] = static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF);
        }

        void PutU64(std::uint8_t *dst, std::uint64_t v)
        {
            for (int i = 0; i < 8; ++i)
                dst[i] = static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF);
        }

        std::uint32_t GetU32(const std::uint8_t *src)
        {
            std::uint32_t v = 0;
            for (int i = 0; i < 4; ++i)
                v |= static_cast<std::uint32_t>(src[i]) << (8 * i);
            return v;
        }

        std::uint64_t GetU64(const std::uint8_t *src)
        {
            std::uint64_t v = 0;
            for (int i = 0; i < 8; ++i)
                v |= static_cast<std::uint64_t>(src[i]) << (8 * i);
            return v;
        }

        chatarc::Status ValidateHeader(const std::uint8_t *hdr, std::size_t n)
        {
            if (n < kFrameHeaderSize)
                return chatarc::Status::FormatError("archive header truncated");
            if (std::memcmp(hdr, kFrameMagic.data(), kFrameMagic.size()) != 0)
                return chatarc::Status::FormatError("not a valid skippable frame format");
            if (GetU32(hdr + kFrameMagic.size()) != kFramePayloadSize)
                return chatarc::Status::FormatError("invalid metadata size");
            return chatarc::Status::Ok();
        }
    } // namespace

    FrameBytes MetadataFrame::Encode(const chatarc::ArchiveCounters &counters)
    {
        FrameBytes out{};
        std::memcpy(out.data(), kFrameMagic.data(), kFrameMagic.size());
        PutU32(out.data() + 4, kFramePayloadSize);
        PutU64(out.data() + 8, counters.last_committed_message_id);
        PutU64(out.data() + 16, counters.total_messages_committed);
        PutU64(out.data() + 24, counters.total_uncompressed_bytes_committed);
        return out;
    }

    chatarc::Status MetadataFrame::Decode(const std::uint8_t *data, std::size_t n,
                                          chatarc::ArchiveCounters *out)
    {
        auto st = ValidateHeader(data, n);
        if (!st.ok())
            return st;
        if (n < kFrameSize)
            return chatarc::Status::FormatError("metadata frame truncated");

        out->last_committed_message_id = GetU64(data + 8);
        out->total_messages_committed = GetU64(data + 16);
        out->total_uncompressed_bytes_committed = GetU64(data + 24);
        return chatarc::Status::Ok();
    }

    chatarc::Status MetadataFrame::Initialize(const std::string &path, chatarc::FsyncPolicy fsync)
    {
        chatarc::util::PosixFile f;
        auto st = chatarc::util::PosixFile::CreateExclusive(path, &f);
        if (!st.ok())
            return st;

        const FrameBytes frame = Encode(chatarc::ArchiveCounters{});
        st = f.PWrite(0, frame.data(), frame.size());
        if (st.ok() && fsync == chatarc::FsyncPolicy::kAlways)
            st = f.SyncData();
        if (st.ok())
            st = f.Close();

        if (!st.ok())
        {
            // A half-written header would later read as a foreign file.
            (void)f.Close();
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }
        return st;
    }

    chatarc::Status MetadataFrame::Read(const std::string &path, chatarc::ArchiveCounters *out)
    {
        chatarc::util::PosixFile f;
        auto st = chatarc::util::PosixFile::OpenRead(path, &f);
        if (!st.ok())
            return st;

        FrameBytes buf{};
        std::size_t got = 0;
        st = f.ReadAt(0, buf.data(), buf.size(), &got);
        if (!st.ok())
            return st;
        return Decode(buf.data(), got, out);
    }

    chatarc::Status MetadataFrame::Overwrite(const std::string &path,
                                             const chatarc::ArchiveCounters &counters,
                                             chatarc::FsyncPolicy fsync)
    {
        chatarc::util::PosixFile f;
        auto st = chatarc::util::PosixFile::OpenReadWrite(path, &f);
        if (!st.ok())
            return st;

        FrameBytes existing{};
        std::size_t got = 0;
        st = f.ReadAt(0, existing.data(), existing.size(), &got);
        if (!st.ok())
            return st;
        st = ValidateHeader(existing.data(), got);
        if (!st.ok())
            return st;
        if (got < kFrameSize)
            return chatarc::Status::FormatError("metadata frame truncated");

        const FrameBytes frame = Encode(counters);
        st = f.PWrite(kFrameHeaderSize, frame.data() + kFrameHeaderSize, kFramePayloadSize);
        if (!st.ok())
            return st;

        if (fsync == chatarc::FsyncPolicy::kAlways)
        {
            st = f.SyncData();
            if (!st.ok())
                return st;
        }
        return f.Close();
    }

} // namespace chatarc::storage
