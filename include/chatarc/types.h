#pragma once
#include <cstdint>
#include <string>
#include <variant>

namespace chatarc
{

    using MessageId = std::uint64_t;
    using ChannelId = std::uint64_t;

    // One fetched chat message. Order within a batch is fetch order (oldest first).
    struct Message
    {
        MessageId id = 0;
        std::string author_display_name;
        std::string body;
    };

    struct GuildChannel
    {
        std::string name;
    };

    struct DirectChannel
    {
        std::string recipient_name;
    };

    struct ChannelInfo
    {
        ChannelId id = 0;
        std::variant<GuildChannel, DirectChannel> kind;
    };

    // Guild channels are named after the channel, direct messages after the peer.
    std::string DisplayName(const ChannelInfo &info);

    // Counters stored in the archive's metadata frame.
    struct ArchiveCounters
    {
        MessageId last_committed_message_id = 0; // 0 => no progress yet
        std::uint64_t total_messages_committed = 0;
        std::uint64_t total_uncompressed_bytes_committed = 0;

        bool operator==(const ArchiveCounters &) const = default;
    };

} // namespace chatarc
