#include "core/shutdown/shutdown_coordinator.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <string>

namespace chatarc::core
{
    namespace
    {
        std::atomic<ShutdownCoordinator *> g_active{nullptr};
        struct sigaction g_prev_int;
        struct sigaction g_prev_term;

        void SignalHandler(int /*signum*/)
        {
            // Only flags are touched here; the archive is never accessed.
            ShutdownCoordinator *c = g_active.load(std::memory_order_acquire);
            if (c)
                c->RequestShutdown();
        }

        chatarc::Status SigErr(const char *what)
        {
            return chatarc::Status::Internal(std::string(what) + ": " + std::strerror(errno));
        }
    } // namespace

    void ShutdownCoordinator::RequestShutdown() noexcept
    {
        if (critical_.load(std::memory_order_acquire))
            deferred_.store(true, std::memory_order_release);
        shutdown_requested_.store(true, std::memory_order_release);
    }

    chatarc::Status ShutdownCoordinator::InstallSignalHandlers(ShutdownCoordinator *c)
    {
        if (!c)
            return chatarc::Status::InvalidArgument("null coordinator");

        ShutdownCoordinator *expected = nullptr;
        if (!g_active.compare_exchange_strong(expected, c, std::memory_order_acq_rel))
            return chatarc::Status::AlreadyExists("signal handlers already installed");

        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = SignalHandler;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;

        if (::sigaction(SIGINT, &sa, &g_prev_int) != 0)
        {
            g_active.store(nullptr, std::memory_order_release);
            return SigErr("sigaction SIGINT");
        }
        if (::sigaction(SIGTERM, &sa, &g_prev_term) != 0)
        {
            auto st = SigErr("sigaction SIGTERM");
            (void)::sigaction(SIGINT, &g_prev_int, nullptr);
            g_active.store(nullptr, std::memory_order_release);
            return st;
        }
        return chatarc::Status::Ok();
    }

    chatarc::Status ShutdownCoordinator::UninstallSignalHandlers()
    {
        if (!g_active.load(std::memory_order_acquire))
            return chatarc::Status::Ok();

        if (::sigaction(SIGINT, &g_prev_int, nullptr) != 0)
            return SigErr("sigaction SIGINT");
        if (::sigaction(SIGTERM, &g_prev_term, nullptr) != 0)
            return SigErr("sigaction SIGTERM");
        g_active.store(nullptr, std::memory_order_release);
        return chatarc::Status::Ok();
    }

} // namespace chatarc::core
