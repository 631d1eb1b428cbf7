#pragma once
#include <atomic>

#include "chatarc/status.h"

namespace chatarc::core
{

    // Cooperative cancellation token for a download session.
    //
    // The signal handler only sets flags. The session loop reads them at its
    // state boundaries and is the only place that stops work, so a commit in
    // progress always runs to completion.
    class ShutdownCoordinator
    {
    public:
        ShutdownCoordinator() = default;

        ShutdownCoordinator(const ShutdownCoordinator &) = delete;
        ShutdownCoordinator &operator=(const ShutdownCoordinator &) = delete;

        // Async-signal-safe.
        void RequestShutdown() noexcept;

        bool shutdown_requested() const noexcept { return shutdown_requested_.load(std::memory_order_acquire); }
        // True when the request arrived while a commit was running.
        bool deferred() const noexcept { return deferred_.load(std::memory_order_acquire); }
        bool in_critical_section() const noexcept { return critical_.load(std::memory_order_acquire); }

        void EnterCriticalSection() noexcept { critical_.store(true, std::memory_order_release); }
        void LeaveCriticalSection() noexcept { critical_.store(false, std::memory_order_release); }

        // Routes SIGINT and SIGTERM to `c`. Only one coordinator is wired at a time.
        static chatarc::Status InstallSignalHandlers(ShutdownCoordinator *c);
        // Restores the dispositions saved by InstallSignalHandlers.
        static chatarc::Status UninstallSignalHandlers();

    private:
        std::atomic<bool> critical_{false};
        std::atomic<bool> shutdown_requested_{false};
        std::atomic<bool> deferred_{false};
    };

} // namespace chatarc::core
