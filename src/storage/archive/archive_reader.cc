#include "storage/archive/archive_reader.h"

#include <algorithm>
#include <memory>
#include <vector>

#include <zstd.h>

#include "storage/frame/metadata_frame.h"
#include "util/posix_file.h"

namespace chatarc::storage
{
    namespace
    {
        struct DCtxDeleter
        {
            void operator()(ZSTD_DCtx *p) const noexcept { ZSTD_freeDCtx(p); }
        };
    } // namespace

    chatarc::Status ArchiveReader::DecodeBatchRegion(const std::string &path,
                                                     const Sink &sink,
                                                     chatarc::ArchiveCounters *counters,
                                                     std::uint64_t *region_bytes)
    {
        chatarc::util::PosixFile f;
        auto st = chatarc::util::PosixFile::OpenRead(path, &f);
        if (!st.ok())
            return st;

        FrameBytes frame{};
        std::size_t got = 0;
        st = f.ReadAt(0, frame.data(), frame.size(), &got);
        if (!st.ok())
            return st;
        st = MetadataFrame::Decode(frame.data(), got, counters);
        if (!st.ok())
            return st;

        std::uint64_t file_size = 0;
        st = f.Size(&file_size);
        if (!st.ok())
            return st;
        *region_bytes = file_size - kFrameSize;

        std::unique_ptr<ZSTD_DCtx, DCtxDeleter> dctx(ZSTD_createDCtx());
        if (!dctx)
            return chatarc::Status::Internal("ZSTD_createDCtx failed");

        std::vector<char> in_buf(ZSTD_DStreamInSize());
        std::vector<char> out_buf(ZSTD_DStreamOutSize());

        std::uint64_t off = kFrameSize;
        std::size_t last_hint = 0;
        while (off < file_size)
        {
            const std::size_t want = static_cast<std::size_t>(
                std::min<std::uint64_t>(in_buf.size(), file_size - off));
            st = f.ReadAt(off, in_buf.data(), want, &got);
            if (!st.ok())
                return st;
            if (got == 0)
                break;
            off += got;

            ZSTD_inBuffer input{in_buf.data(), got, 0};
            bool output_full = false;
            while (input.pos < input.size || output_full)
            {
                ZSTD_outBuffer output{out_buf.data(), out_buf.size(), 0};
                const std::size_t ret = ZSTD_decompressStream(dctx.get(), &output, &input);
                if (ZSTD_isError(ret))
                    return chatarc::Status::FormatError(std::string("batch region: ") + ZSTD_getErrorName(ret));
                if (output.pos > 0)
                    sink(out_buf.data(), output.pos);
                // A full output buffer may leave decoded bytes inside the context.
                output_full = output.pos == output.size;
                last_hint = ret;
            }
        }

        // A non-zero hint means the decoder stopped inside a frame.
        if (last_hint != 0)
            return chatarc::Status::FormatError("batch region ends inside a compressed chunk");
        return chatarc::Status::Ok();
    }

    chatarc::Status ArchiveReader::Verify(const std::string &path, VerifyReport *out)
    {
        VerifyReport report;
        auto st = DecodeBatchRegion(
            path,
            [&report](const char *data, std::size_t n)
            {
                report.decoded_bytes += n;
                report.transcript_lines += static_cast<std::uint64_t>(std::count(data, data + n, '\n'));
            },
            &report.counters, &report.batch_region_bytes);
        if (!st.ok())
            return st;

        report.reconciled = report.decoded_bytes == report.counters.total_uncompressed_bytes_committed;
        *out = report;
        return chatarc::Status::Ok();
    }

    chatarc::Status ArchiveReader::ReadTranscript(const std::string &path, std::string *out)
    {
        std::string transcript;
        chatarc::ArchiveCounters counters;
        std::uint64_t region_bytes = 0;
        auto st = DecodeBatchRegion(
            path,
            [&transcript](const char *data, std::size_t n) { transcript.append(data, n); },
            &counters, &region_bytes);
        if (!st.ok())
            return st;
        *out = std::move(transcript);
        return chatarc::Status::Ok();
    }

} // namespace chatarc::storage
