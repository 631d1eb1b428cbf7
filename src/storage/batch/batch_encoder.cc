#include "storage/batch/batch_encoder.h"

#include <algorithm>
#include <string_view>

#include <zstd.h>

namespace chatarc::storage
{
    namespace
    {
        // The sentinel must never occur inside a field, so NUL bytes are dropped.
        void AppendField(std::string_view field, std::string *out)
        {
            for (char c : field)
            {
                if (c != kTranscriptSentinel)
                    out->push_back(c);
            }
        }
    } // namespace

    void BatchEncoder::CCtxDeleter::operator()(ZSTD_CCtx_s *p) const noexcept
    {
        ZSTD_freeCCtx(p);
    }

    BatchEncoder::BatchEncoder(int compression_level)
        : level_(std::clamp(compression_level, ZSTD_minCLevel(), ZSTD_maxCLevel())),
          cctx_(ZSTD_createCCtx())
    {
    }

    BatchEncoder::~BatchEncoder() = default;

    void BatchEncoder::AppendLine(const chatarc::Message &m, std::string *out)
    {
        if (m.body.empty())
            return;
        out->push_back(kTranscriptSentinel);
        out->push_back('<');
        AppendField(m.author_display_name, out);
        out->push_back('>');
        out->push_back(kTranscriptSentinel);
        AppendField(m.body, out);
        out->push_back('\n');
    }

    std::string BatchEncoder::BuildTranscript(const std::vector<chatarc::Message> &messages)
    {
        std::string transcript;
        for (const auto &m : messages)
            AppendLine(m, &transcript);
        return transcript;
    }

    chatarc::Status BatchEncoder::Encode(const std::vector<chatarc::Message> &messages, EncodedBatch *out)
    {
        if (messages.empty())
            return chatarc::Status::InvalidArgument("cannot encode an empty batch");
        if (!cctx_)
            return chatarc::Status::Internal("ZSTD_createCCtx failed");

        const std::string transcript = BuildTranscript(messages);

        ZSTD_CCtx *cctx = cctx_.get();
        std::size_t rc = ZSTD_CCtx_reset(cctx, ZSTD_reset_session_and_parameters);
        if (!ZSTD_isError(rc))
            rc = ZSTD_CCtx_setParameter(cctx, ZSTD_c_compressionLevel, level_);
        if (!ZSTD_isError(rc))
            rc = ZSTD_CCtx_setParameter(cctx, ZSTD_c_checksumFlag, 1);
        if (ZSTD_isError(rc))
            return chatarc::Status::Internal(std::string("zstd parameter: ") + ZSTD_getErrorName(rc));

        std::vector<std::uint8_t> compressed(ZSTD_compressBound(transcript.size()));
        const std::size_t n = ZSTD_compress2(cctx,
                                             compressed.data(), compressed.size(),
                                             transcript.data(), transcript.size());
        if (ZSTD_isError(n))
            return chatarc::Status::Internal(std::string("zstd compression failed: ") + ZSTD_getErrorName(n));
        compressed.resize(n);

        out->compressed_chunk = std::move(compressed);
        out->transcript_len = transcript.size();
        out->last_message_id = messages.back().id;
        out->message_count = messages.size();
        return chatarc::Status::Ok();
    }

} // namespace chatarc::storage
