#pragma once
#include <cstdint>
#include <string>

#include "chatarc/options.h"
#include "chatarc/status.h"
#include "chatarc/types.h"
#include "storage/batch/batch_encoder.h"

namespace chatarc::storage
{

    // Owns the write side of one archive file.
    //
    // Commit protocol, in this order:
    //   1. compute the advanced counters
    //   2. overwrite the metadata frame in place
    //   3. append the batch's compressed chunk
    // A crash between 2 and 3 leaves counters that claim messages whose bytes
    // were never written; resume skips them. Callers wrap Commit in a
    // ShutdownCoordinator critical section so only uncatchable faults can
    // land in that window.
    class ArchiveWriter
    {
    public:
        // Failpoint name that aborts Commit between steps 2 and 3.
        static constexpr const char *kFailAfterMetadata = "commit_after_metadata";

        ArchiveWriter(std::string path, chatarc::FsyncPolicy fsync);

        ArchiveWriter(const ArchiveWriter &) = delete;
        ArchiveWriter &operator=(const ArchiveWriter &) = delete;

        // Initializes the frame when the file is absent. *created reports it.
        chatarc::Status EnsureInitialized(bool *created);

        // Reads the committed counters into the writer's cursor.
        chatarc::Status Load(chatarc::ArchiveCounters *out);

        chatarc::Status Commit(const EncodedBatch &batch);

        static chatarc::ArchiveCounters Advance(const chatarc::ArchiveCounters &current,
                                                const EncodedBatch &batch);

        const chatarc::ArchiveCounters &counters() const noexcept { return counters_; }

    private:
        chatarc::Status AppendChunk(const EncodedBatch &batch);

        std::string path_;
        chatarc::FsyncPolicy fsync_;
        chatarc::ArchiveCounters counters_;
        bool loaded_ = false;
    };

} // namespace chatarc::storage
