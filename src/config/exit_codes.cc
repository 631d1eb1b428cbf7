#include "config/exit_codes.h"

namespace chatarc::config
{

    int ExitCodeFor(const chatarc::Status &st)
    {
        if (st.ok())
            return kExitOk;
        if (st.IsNotFound())
            return kExitChannelNotFound;
        return kExitError;
    }

    int VerifyExitCode(const chatarc::Status &st, const chatarc::storage::VerifyReport &report)
    {
        if (!st.ok())
            return kExitError;
        return report.reconciled ? kExitOk : kExitNotReconciled;
    }

} // namespace chatarc::config
