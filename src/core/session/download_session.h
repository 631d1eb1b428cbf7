#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "chatarc/history_source.h"
#include "chatarc/options.h"
#include "chatarc/status.h"
#include "chatarc/types.h"
#include "core/shutdown/shutdown_coordinator.h"
#include "storage/archive/archive_writer.h"
#include "storage/batch/batch_encoder.h"

namespace chatarc::core
{

    enum class SessionState : std::uint8_t
    {
        kStart,
        kLoaded,
        kFetching,
        kCommitting,
        kCheck,
        kDone,
    };

    const char *SessionStateName(SessionState s);

    struct SessionReport
    {
        std::string archive_path;
        std::string channel_name;
        chatarc::ArchiveCounters counters;
        std::uint64_t batches_committed = 0; // this run only
        std::uint64_t messages_fetched = 0;  // this run only
        bool created = false;
        bool stopped_by_shutdown = false;
    };

    // Drives fetch -> commit cycles for one channel until the history is
    // exhausted or a shutdown is requested.
    //
    //   START -> LOADED -> FETCHING -> COMMITTING -> CHECK -> (FETCHING | DONE)
    //
    // There is no retry state. Any error from the source or the archive ends
    // the run; the next process invocation resumes from the committed frame.
    class DownloadSession
    {
    public:
        using TransitionObserver = std::function<void(SessionState from, SessionState to)>;

        DownloadSession(chatarc::HistorySource *source,
                        chatarc::ChannelId channel,
                        chatarc::ArchiveOptions options,
                        ShutdownCoordinator *shutdown);

        DownloadSession(const DownloadSession &) = delete;
        DownloadSession &operator=(const DownloadSession &) = delete;

        chatarc::Status Run(SessionReport *out);

        SessionState state() const noexcept { return state_; }
        void SetTransitionObserver(TransitionObserver obs) { observer_ = std::move(obs); }

        // "<channel display name>.zst" unless `explicit_path` is set.
        static std::string ArchivePathFor(const chatarc::ChannelInfo &info, const std::string &explicit_path);

    private:
        chatarc::Status RunLoop();
        chatarc::Status OnStart();
        chatarc::Status OnLoaded();
        chatarc::Status OnFetching();
        chatarc::Status OnCommitting();
        chatarc::Status OnCheck();
        void Finish();
        void TransitionTo(SessionState next);

        chatarc::HistorySource *source_;
        chatarc::ChannelId channel_;
        chatarc::ArchiveOptions options_;
        ShutdownCoordinator *shutdown_;

        SessionState state_ = SessionState::kStart;
        TransitionObserver observer_;

        std::unique_ptr<chatarc::storage::ArchiveWriter> writer_;
        chatarc::storage::BatchEncoder encoder_;
        std::optional<chatarc::MessageId> cursor_;
        std::vector<chatarc::Message> batch_;
        SessionReport report_;
    };

} // namespace chatarc::core
