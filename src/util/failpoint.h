#pragma once
#include <string_view>

namespace chatarc::util
{
    // True when CHATARC_FAILPOINT names `name`. Lets tests stop a write
    // protocol at a chosen step, as a crash would.
    bool FailpointHit(std::string_view name);
}
