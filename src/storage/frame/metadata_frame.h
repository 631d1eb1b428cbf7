#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include "chatarc/options.h"
#include "chatarc/status.h"
#include "chatarc/types.h"

namespace chatarc::storage
{

    // Archive header: a zstd skippable frame carrying the progress counters.
    //
    //   [0..4)   magic 50 2A 4D 18 (skippable frame, nibble 0)
    //   [4..8)   u32 LE payload length = 24
    //   [8..32)  u64 LE last_committed_message_id,
    //            u64 LE total_messages_committed,
    //            u64 LE total_uncompressed_bytes_committed
    //
    // zstd decoders skip the frame, so the whole file stays a valid .zst stream.
    constexpr std::array<std::uint8_t, 4> kFrameMagic = {0x50, 0x2A, 0x4D, 0x18};
    constexpr std::uint32_t kFramePayloadSize = 3 * sizeof(std::uint64_t);
    constexpr std::size_t kFrameHeaderSize = kFrameMagic.size() + sizeof(std::uint32_t);
    constexpr std::size_t kFrameSize = kFrameHeaderSize + kFramePayloadSize;

    using FrameBytes = std::array<std::uint8_t, kFrameSize>;

    class MetadataFrame
    {
    public:
        // Creates `path` holding a zeroed frame. kAlreadyExists if present.
        static chatarc::Status Initialize(const std::string &path,
                                          chatarc::FsyncPolicy fsync = chatarc::FsyncPolicy::kNever);

        // kFormatError on wrong magic, wrong declared length or a short header.
        static chatarc::Status Read(const std::string &path, chatarc::ArchiveCounters *out);

        // Rewrites the 24-byte payload in place after re-validating the header.
        // The file length never changes.
        static chatarc::Status Overwrite(const std::string &path,
                                         const chatarc::ArchiveCounters &counters,
                                         chatarc::FsyncPolicy fsync = chatarc::FsyncPolicy::kNever);

        static FrameBytes Encode(const chatarc::ArchiveCounters &counters);
        static chatarc::Status Decode(const std::uint8_t *data, std::size_t n,
                                      chatarc::ArchiveCounters *out);
    };

} // namespace chatarc::storage
