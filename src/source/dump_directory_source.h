#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "chatarc/history_source.h"

namespace chatarc::source
{

    // Serves channel history from exported dump files:
    //
    //   <dir>/<channel_id>.tsv
    //     #guild<TAB><channel name>      or   #dm<TAB><recipient name>
    //     <id><TAB><author><TAB><body>   one message per line, ids ascending
    //
    // Author and body escape backslash, tab and newline as \\ \t \n.
    class DumpDirectorySource : public chatarc::HistorySource
    {
    public:
        explicit DumpDirectorySource(std::string dir);

        chatarc::Status ResolveChannel(chatarc::ChannelId channel, chatarc::ChannelInfo *out) override;
        chatarc::Status Fetch(chatarc::ChannelId channel,
                              std::optional<chatarc::MessageId> after,
                              std::size_t limit,
                              std::vector<chatarc::Message> *out) override;
        void Close() override;

        std::string ChannelPath(chatarc::ChannelId channel) const;

        // Exposed for tests.
        static bool Unescape(std::string_view in, std::string *out);
        static std::string Escape(std::string_view in);

    private:
        chatarc::Status Load(chatarc::ChannelId channel);

        std::string dir_;
        std::optional<chatarc::ChannelId> loaded_;
        chatarc::ChannelInfo info_;
        std::vector<chatarc::Message> messages_;
    };

} // namespace chatarc::source
