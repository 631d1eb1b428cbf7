#pragma once
#include "chatarc/status.h"
#include "storage/archive/archive_reader.h"

namespace chatarc::config
{

    // Process exit codes shared by chatarc and chatarc_verify.
    constexpr int kExitOk = 0;
    constexpr int kExitChannelNotFound = 1;
    constexpr int kExitNotReconciled = 1;
    constexpr int kExitError = 2;

    // chatarc: a graceful stop is a successful run and maps to kExitOk.
    int ExitCodeFor(const chatarc::Status &st);

    // chatarc_verify: `report` is only read when `st` is ok.
    int VerifyExitCode(const chatarc::Status &st, const chatarc::storage::VerifyReport &report);

} // namespace chatarc::config
