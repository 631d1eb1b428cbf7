#include "source/dump_directory_source.h"

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <fstream>

#include "util/logging.h"

namespace fs = std::filesystem;

namespace chatarc::source
{
    namespace
    {
        bool ParseId(std::string_view tok, chatarc::MessageId *out)
        {
            if (tok.empty())
                return false;
            auto [ptr, ec] = std::from_chars(tok.data(), tok.data() + tok.size(), *out);
            return ec == std::errc() && ptr == tok.data() + tok.size();
        }

        std::vector<std::string_view> SplitTabs(std::string_view line, std::size_t max_fields)
        {
            std::vector<std::string_view> out;
            while (out.size() + 1 < max_fields)
            {
                auto pos = line.find('\t');
                if (pos == std::string_view::npos)
                    break;
                out.push_back(line.substr(0, pos));
                line.remove_prefix(pos + 1);
            }
            out.push_back(line);
            return out;
        }
    } // namespace

    DumpDirectorySource::DumpDirectorySource(std::string dir) : dir_(std::move(dir)) {}

    std::string DumpDirectorySource::ChannelPath(chatarc::ChannelId channel) const
    {
        return (fs::path(dir_) / (std::to_string(channel) + ".tsv")).string();
    }

    std::string DumpDirectorySource::Escape(std::string_view in)
    {
        std::string out;
        out.reserve(in.size());
        for (char c : in)
        {
            switch (c)
            {
            case '\\': out += "\\\\"; break;
            case '\t': out += "\\t"; break;
            case '\n': out += "\\n"; break;
            default: out.push_back(c); break;
            }
        }
        return out;
    }

    bool DumpDirectorySource::Unescape(std::string_view in, std::string *out)
    {
        out->clear();
        out->reserve(in.size());
        for (std::size_t i = 0; i < in.size(); ++i)
        {
            const char c = in[i];
            if (c != '\\')
            {
                out->push_back(c);
                continue;
            }
            if (++i == in.size())
                return false;
            switch (in[i])
            {
            case '\\': out->push_back('\\'); break;
            case 't': out->push_back('\t'); break;
            case 'n': out->push_back('\n'); break;
            default: return false;
            }
        }
        return true;
    }

    chatarc::Status DumpDirectorySource::Load(chatarc::ChannelId channel)
    {
        if (loaded_ && *loaded_ == channel)
            return chatarc::Status::Ok();

        const std::string path = ChannelPath(channel);
        std::error_code ec;
        if (!fs::exists(path, ec))
            return chatarc::Status::ChannelNotFound("channel " + std::to_string(channel) + " not found");

        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
            return chatarc::Status::TransportError("cannot open " + path);

        std::string line;
        if (!std::getline(in, line))
            return chatarc::Status::TransportError(path + ": missing channel header");
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        chatarc::ChannelInfo info;
        info.id = channel;
        auto hdr = SplitTabs(line, 2);
        std::string name;
        if (hdr.size() != 2 || !Unescape(hdr[1], &name))
            return chatarc::Status::TransportError(path + ": malformed channel header");
        if (hdr[0] == "#guild")
            info.kind = chatarc::GuildChannel{name};
        else if (hdr[0] == "#dm")
            info.kind = chatarc::DirectChannel{name};
        else
            return chatarc::Status::TransportError(path + ": unknown channel kind");

        std::vector<chatarc::Message> messages;
        std::size_t lineno = 1;
        while (std::getline(in, line))
        {
            ++lineno;
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.empty())
                continue;

            auto f = SplitTabs(line, 3);
            chatarc::Message m;
            if (f.size() != 3 || !ParseId(f[0], &m.id) ||
                !Unescape(f[1], &m.author_display_name) || !Unescape(f[2], &m.body))
            {
                return chatarc::Status::TransportError(path + ":" + std::to_string(lineno) + ": malformed message");
            }
            messages.push_back(std::move(m));
        }
        if (in.bad())
            return chatarc::Status::TransportError("read failed: " + path);

        std::stable_sort(messages.begin(), messages.end(),
                         [](const chatarc::Message &a, const chatarc::Message &b) { return a.id < b.id; });

        info_ = std::move(info);
        messages_ = std::move(messages);
        loaded_ = channel;
        CHATARC_LOG_DEBUG("loaded ", messages_.size(), " messages from ", path);
        return chatarc::Status::Ok();
    }

    chatarc::Status DumpDirectorySource::ResolveChannel(chatarc::ChannelId channel, chatarc::ChannelInfo *out)
    {
        auto st = Load(channel);
        if (!st.ok())
            return st;
        *out = info_;
        return chatarc::Status::Ok();
    }

    chatarc::Status DumpDirectorySource::Fetch(chatarc::ChannelId channel,
                                               std::optional<chatarc::MessageId> after,
                                               std::size_t limit,
                                               std::vector<chatarc::Message> *out)
    {
        auto st = Load(channel);
        if (!st.ok())
        {
            // Resolution already succeeded once; anything now is a transport fault.
            if (st.IsNotFound())
                return chatarc::Status::TransportError(st.message());
            return st;
        }

        out->clear();
        auto it = messages_.begin();
        if (after)
        {
            it = std::upper_bound(messages_.begin(), messages_.end(), *after,
                                  [](chatarc::MessageId id, const chatarc::Message &m) { return id < m.id; });
        }
        for (; it != messages_.end() && out->size() < limit; ++it)
            out->push_back(*it);
        return chatarc::Status::Ok();
    }

    void DumpDirectorySource::Close()
    {
        loaded_.reset();
        messages_.clear();
    }

} // namespace chatarc::source
