#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "chatarc/status.h"
#include "chatarc/types.h"

namespace chatarc::storage
{

    struct VerifyReport
    {
        chatarc::ArchiveCounters counters;
        std::uint64_t batch_region_bytes = 0; // compressed bytes after the frame
        std::uint64_t decoded_bytes = 0;
        std::uint64_t transcript_lines = 0;
        // decoded_bytes == counters.total_uncompressed_bytes_committed
        bool reconciled = false;
    };

    // Sequential read-back of a whole archive. There is no random access:
    // the batch region is decoded front to back as one zstd stream.
    class ArchiveReader
    {
    public:
        using Sink = std::function<void(const char *data, std::size_t n)>;

        static chatarc::Status Verify(const std::string &path, VerifyReport *out);
        static chatarc::Status ReadTranscript(const std::string &path, std::string *out);

    private:
        static chatarc::Status DecodeBatchRegion(const std::string &path,
                                                 const Sink &sink,
                                                 chatarc::ArchiveCounters *counters,
                                                 std::uint64_t *region_bytes);
    };

} // namespace chatarc::storage
