#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "chatarc/options.h"
#include "chatarc/status.h"
#include "chatarc/types.h"

namespace chatarc::config
{

    struct ArchiverConfig
    {
        std::string token;
        chatarc::ChannelId channel{0};
        std::string path; // empty => "<channel name>.zst"
        std::size_t batch_size{chatarc::kDefaultBatchSize};
        std::string source_dir{"."};
        int compression_level{chatarc::kDefaultCompressionLevel};
        chatarc::FsyncPolicy fsync{chatarc::FsyncPolicy::kNever};

        std::string log_path;
        std::string log_level{"info"};

        chatarc::ArchiveOptions ToArchiveOptions() const;
    };

    // `key: value` lines, '#' comments, optional double quotes around values.
    // A missing file leaves the defaults in place. Unknown keys are ignored.
    chatarc::Status LoadConfigFile(const std::string &path, ArchiverConfig *cfg);

    // Applies one setting; shared by the file loader and the command line.
    // Returns kNotFound for an unknown key.
    chatarc::Status ApplySetting(std::string_view key, std::string_view value, ArchiverConfig *cfg);

} // namespace chatarc::config
