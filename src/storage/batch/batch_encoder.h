#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "chatarc/options.h"
#include "chatarc/status.h"
#include "chatarc/types.h"

struct ZSTD_CCtx_s;

namespace chatarc::storage
{

    // Transcript line: NUL '<' author '>' NUL body '\n'
    constexpr char kTranscriptSentinel = '\0';

    // One fetch batch ready to be committed.
    struct EncodedBatch
    {
        std::vector<std::uint8_t> compressed_chunk; // one self-contained zstd frame
        std::uint64_t transcript_len = 0;           // uncompressed bytes in the chunk
        chatarc::MessageId last_message_id = 0;
        std::uint64_t message_count = 0;            // includes empty-body messages
    };

    class BatchEncoder
    {
    public:
        explicit BatchEncoder(int compression_level = chatarc::kDefaultCompressionLevel);
        ~BatchEncoder();

        BatchEncoder(const BatchEncoder &) = delete;
        BatchEncoder &operator=(const BatchEncoder &) = delete;

        // Messages with an empty body contribute no line.
        static std::string BuildTranscript(const std::vector<chatarc::Message> &messages);
        static void AppendLine(const chatarc::Message &m, std::string *out);

        // kInvalidArgument on an empty batch, kInternal if zstd fails.
        chatarc::Status Encode(const std::vector<chatarc::Message> &messages, EncodedBatch *out);

        int level() const noexcept { return level_; }

    private:
        struct CCtxDeleter
        {
            void operator()(ZSTD_CCtx_s *p) const noexcept;
        };

        int level_;
        std::unique_ptr<ZSTD_CCtx_s, CCtxDeleter> cctx_;
    };

} // namespace chatarc::storage
