#pragma once
#include <cstddef>
#include <optional>
#include <vector>

#include "chatarc/status.h"
#include "chatarc/types.h"

namespace chatarc
{

    // Paginated chat history provider. Implementations own authentication and
    // transport; the archiver only sees ordered batches.
    class HistorySource
    {
    public:
        virtual ~HistorySource() = default;

        // kNotFound when the channel cannot be resolved.
        virtual Status ResolveChannel(ChannelId channel, ChannelInfo *out) = 0;

        // Up to `limit` messages with id > *after (or from the start when
        // `after` is empty), oldest first. Failures are kTransport.
        virtual Status Fetch(ChannelId channel,
                             std::optional<MessageId> after,
                             std::size_t limit,
                             std::vector<Message> *out) = 0;

        // Releases the remote session. Called once when the download ends.
        virtual void Close() {}
    };

} // namespace chatarc
