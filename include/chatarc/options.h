#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace chatarc
{

    enum class FsyncPolicy : uint8_t
    {
        kNever = 0,
        kAlways = 1,
    };

    // zstd's maximum level; archives are written once and read rarely.
    constexpr int kDefaultCompressionLevel = 22;
    constexpr std::size_t kDefaultBatchSize = 100;

    struct ArchiveOptions
    {
        std::string path;
        std::size_t batch_size = kDefaultBatchSize;
        int compression_level = kDefaultCompressionLevel;
        FsyncPolicy fsync = FsyncPolicy::kNever;
    };

} // namespace chatarc
