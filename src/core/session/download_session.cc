#include "core/session/download_session.h"

#include "util/logging.h"

namespace chatarc::core
{

    const char *SessionStateName(SessionState s)
    {
        switch (s)
        {
        case SessionState::kStart:
            return "START";
        case SessionState::kLoaded:
            return "LOADED";
        case SessionState::kFetching:
            return "FETCHING";
        case SessionState::kCommitting:
            return "COMMITTING";
        case SessionState::kCheck:
            return "CHECK";
        case SessionState::kDone:
            return "DONE";
        }
        return "UNKNOWN";
    }

    DownloadSession::DownloadSession(chatarc::HistorySource *source,
                                     chatarc::ChannelId channel,
                                     chatarc::ArchiveOptions options,
                                     ShutdownCoordinator *shutdown)
        : source_(source),
          channel_(channel),
          options_(std::move(options)),
          shutdown_(shutdown),
          encoder_(options_.compression_level) {}

    std::string DownloadSession::ArchivePathFor(const chatarc::ChannelInfo &info, const std::string &explicit_path)
    {
        if (!explicit_path.empty())
            return explicit_path;
        return chatarc::DisplayName(info) + ".zst";
    }

    void DownloadSession::TransitionTo(SessionState next)
    {
        const SessionState prev = state_;
        // The critical section spans exactly the COMMITTING state.
        if (next == SessionState::kCommitting)
            shutdown_->EnterCriticalSection();
        else if (prev == SessionState::kCommitting)
            shutdown_->LeaveCriticalSection();
        state_ = next;
        CHATARC_LOG_DEBUG("session ", SessionStateName(prev), " -> ", SessionStateName(next));
        if (observer_)
            observer_(prev, next);
    }

    chatarc::Status DownloadSession::Run(SessionReport *out)
    {
        if (!source_ || !shutdown_)
            return chatarc::Status::InvalidArgument("session needs a source and a shutdown coordinator");
        if (options_.batch_size == 0)
            return chatarc::Status::InvalidArgument("batch size must be at least 1");
        if (state_ != SessionState::kStart)
            return chatarc::Status::InvalidArgument("session already ran");

        auto st = RunLoop();
        shutdown_->LeaveCriticalSection();
        // The remote session is released on every exit path.
        source_->Close();
        if (!st.ok())
        {
            CHATARC_LOG_ERROR("download aborted in state ", SessionStateName(state_), ": ", st.ToString());
            return st;
        }
        if (out)
            *out = report_;
        return chatarc::Status::Ok();
    }

    chatarc::Status DownloadSession::RunLoop()
    {
        while (state_ != SessionState::kDone)
        {
            chatarc::Status st;
            switch (state_)
            {
            case SessionState::kStart:
                st = OnStart();
                break;
            case SessionState::kLoaded:
                st = OnLoaded();
                break;
            case SessionState::kFetching:
                st = OnFetching();
                break;
            case SessionState::kCommitting:
                st = OnCommitting();
                break;
            case SessionState::kCheck:
                st = OnCheck();
                break;
            case SessionState::kDone:
                break;
            }
            if (!st.ok())
                return st;
        }
        Finish();
        return chatarc::Status::Ok();
    }

    chatarc::Status DownloadSession::OnStart()
    {
        chatarc::ChannelInfo info;
        auto st = source_->ResolveChannel(channel_, &info);
        if (!st.ok())
            return st;

        report_.channel_name = chatarc::DisplayName(info);
        report_.archive_path = ArchivePathFor(info, options_.path);
        CHATARC_LOG_INFO("operating on ", report_.archive_path);

        writer_ = std::make_unique<chatarc::storage::ArchiveWriter>(report_.archive_path, options_.fsync);
        st = writer_->EnsureInitialized(&report_.created);
        if (!st.ok())
            return st;
        if (report_.created)
            CHATARC_LOG_INFO("partial data not found, starting a new download");

        TransitionTo(SessionState::kLoaded);
        return chatarc::Status::Ok();
    }

    chatarc::Status DownloadSession::OnLoaded()
    {
        chatarc::ArchiveCounters counters;
        auto st = writer_->Load(&counters);
        if (!st.ok())
            return st;

        if (counters.last_committed_message_id == 0)
            cursor_.reset();
        else
            cursor_ = counters.last_committed_message_id;
        report_.counters = counters;

        CHATARC_LOG_INFO("last read message: ", counters.last_committed_message_id,
                         ", total messages read: ", counters.total_messages_committed,
                         ", total uncompressed size: ", counters.total_uncompressed_bytes_committed, " bytes");

        TransitionTo(SessionState::kFetching);
        return chatarc::Status::Ok();
    }

    chatarc::Status DownloadSession::OnFetching()
    {
        // Outside a commit a shutdown request stops the run right away.
        if (shutdown_->shutdown_requested())
        {
            CHATARC_LOG_INFO("shutdown requested, exiting");
            report_.stopped_by_shutdown = true;
            TransitionTo(SessionState::kDone);
            return chatarc::Status::Ok();
        }

        batch_.clear();
        auto st = source_->Fetch(channel_, cursor_, options_.batch_size, &batch_);
        if (!st.ok())
            return st;
        if (batch_.size() > options_.batch_size)
            return chatarc::Status::TransportError("source returned more messages than requested");

        if (shutdown_->shutdown_requested())
        {
            // Nothing of this batch is committed; the next run fetches it again.
            CHATARC_LOG_INFO("shutdown requested, discarding uncommitted batch of ", batch_.size());
            report_.stopped_by_shutdown = true;
            TransitionTo(SessionState::kDone);
            return chatarc::Status::Ok();
        }

        if (batch_.empty())
        {
            TransitionTo(SessionState::kDone);
            return chatarc::Status::Ok();
        }

        report_.messages_fetched += batch_.size();
        TransitionTo(SessionState::kCommitting);
        return chatarc::Status::Ok();
    }

    chatarc::Status DownloadSession::OnCommitting()
    {
        chatarc::storage::EncodedBatch encoded;
        auto st = encoder_.Encode(batch_, &encoded);
        if (!st.ok())
            return st;

        st = writer_->Commit(encoded);
        if (!st.ok())
            return st;

        report_.counters = writer_->counters();
        ++report_.batches_committed;
        TransitionTo(SessionState::kCheck);
        return chatarc::Status::Ok();
    }

    chatarc::Status DownloadSession::OnCheck()
    {
        if (shutdown_->shutdown_requested())
        {
            if (shutdown_->deferred())
                CHATARC_LOG_INFO("signal arrived during the commit; it was deferred until the commit finished");
            CHATARC_LOG_INFO("shutdown was requested, exiting now");
            report_.stopped_by_shutdown = true;
            TransitionTo(SessionState::kDone);
            return chatarc::Status::Ok();
        }

        const auto &c = writer_->counters();
        CHATARC_LOG_INFO("batch read. total messages: ", c.total_messages_committed,
                         ", total uncompressed size: ", c.total_uncompressed_bytes_committed, " bytes");

        if (batch_.size() < options_.batch_size)
        {
            TransitionTo(SessionState::kDone);
            return chatarc::Status::Ok();
        }

        cursor_ = c.last_committed_message_id;
        TransitionTo(SessionState::kFetching);
        return chatarc::Status::Ok();
    }

    void DownloadSession::Finish()
    {
        const auto &c = report_.counters;
        if (report_.stopped_by_shutdown)
        {
            CHATARC_LOG_INFO("stopped on request. total messages: ", c.total_messages_committed,
                             ", total uncompressed size: ", c.total_uncompressed_bytes_committed, " bytes");
        }
        else
        {
            CHATARC_LOG_INFO("finished downloading! total messages: ", c.total_messages_committed,
                             ", total uncompressed size: ", c.total_uncompressed_bytes_committed, " bytes");
        }
    }

} // namespace chatarc::core
