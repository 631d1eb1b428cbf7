#include "chatarc/types.h"

#include <type_traits>

namespace chatarc
{

    std::string DisplayName(const ChannelInfo &info)
    {
        return std::visit(
            [](const auto &k) -> std::string
            {
                using T = std::decay_t<decltype(k)>;
                if constexpr (std::is_same_v<T, GuildChannel>)
                    return k.name;
                else
                    return k.recipient_name;
            },
            info.kind);
    }

} // namespace chatarc
