#include "util/failpoint.h"

#include <cstdlib>

namespace chatarc::util
{
    bool FailpointHit(std::string_view name)
    {
        const char *fp = ::getenv("CHATARC_FAILPOINT");
        if (!fp)
            return false;
        return name == fp;
    }
}
