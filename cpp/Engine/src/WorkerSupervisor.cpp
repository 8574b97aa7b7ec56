#include "WorkerSupervisor.hpp"

#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "Logger.hpp"

namespace tl
{
namespace
{
std::string describe_exit(int status)
{
    if (WIFEXITED(status))
    {
        return "exit status " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status))
    {
        return std::string("signal ") + ::strsignal(WTERMSIG(status));
    }
    return "status " + std::to_string(status);
}
} // namespace

unsigned resolve_worker_count(unsigned hint, unsigned max, unsigned cores)
{
    const unsigned ceiling = std::max(1U, max);
    if (hint > 0)
    {
        return std::min(hint, ceiling);
    }

    const unsigned derived = 2 * std::max(1U, cores) + 1;
    return std::min(derived, ceiling);
}

WorkerSupervisor::WorkerSupervisor(unsigned worker_count, WorkerEntry entry)
    : io_context_(),
      signals_(io_context_, SIGINT, SIGTERM, SIGCHLD),
      worker_count_(std::max(1U, worker_count)),
      entry_(std::move(entry))
{
    if (!entry_)
    {
        throw std::invalid_argument("WorkerSupervisor requires a worker entry point");
    }
}

int WorkerSupervisor::run()
{
    tl::log::info("Starting " + std::to_string(worker_count_) + " worker process(es)");

    wait_for_signal();
    for (unsigned i = 0; i < worker_count_ && !stopping_; ++i)
    {
        spawn();
    }

    io_context_.run();

    tl::log::info("Supervisor exiting with status " + std::to_string(exit_status_));
    return exit_status_;
}

void WorkerSupervisor::spawn()
{
    io_context_.notify_fork(boost::asio::io_context::fork_prepare);

    const pid_t pid = ::fork();
    if (pid < 0)
    {
        const int error = errno;
        io_context_.notify_fork(boost::asio::io_context::fork_parent);
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(error));
    }

    if (pid == 0)
    {
        io_context_.notify_fork(boost::asio::io_context::fork_child);

        // Back to default dispositions; SIGTERM ends a worker immediately.
        boost::system::error_code ec;
        signals_.clear(ec);

        int status = EXIT_FAILURE;
        try
        {
            status = entry_();
        }
        catch (const std::exception &ex)
        {
            tl::log::fatal(std::string("Worker terminated by exception: ") + ex.what());
        }

        std::cout.flush();
        std::cerr.flush();
        ::_exit(status);
    }

    io_context_.notify_fork(boost::asio::io_context::fork_parent);
    workers_.insert(pid);
    tl::log::info("Booted worker with pid " + std::to_string(pid));
}

void WorkerSupervisor::wait_for_signal()
{
    signals_.async_wait([this](const boost::system::error_code &ec, int signal_number) {
        if (ec)
        {
            return;
        }

        on_signal(signal_number);
        if (!(stopping_ && workers_.empty()))
        {
            wait_for_signal();
        }
    });
}

void WorkerSupervisor::on_signal(int signal_number)
{
    if (signal_number == SIGCHLD)
    {
        reap();
        return;
    }

    if (!stopping_)
    {
        tl::log::info(std::string("Received ") + ::strsignal(signal_number) + ", shutting down workers");
        halt(0);
    }
}

void WorkerSupervisor::reap()
{
    int status = 0;
    pid_t pid = 0;
    while ((pid = ::waitpid(-1, &status, WNOHANG)) > 0)
    {
        if (workers_.erase(pid) == 0)
        {
            continue;
        }

        if (stopping_)
        {
            tl::log::debug("Worker " + std::to_string(pid) + " stopped (" + describe_exit(status) + ")");
            continue;
        }

        if (WIFEXITED(status) && WEXITSTATUS(status) == kWorkerBootFailure)
        {
            tl::log::fatal("Worker " + std::to_string(pid) + " failed to boot; shutting down");
            tl::log::event(tl::log::Level::Fatal, "worker_boot_failed", {{"worker_pid", static_cast<long>(pid)}});
            halt(kWorkerBootFailure);
            continue;
        }

        tl::log::warn("Worker " + std::to_string(pid) + " died (" + describe_exit(status) + "); respawning");
        spawn();
    }

    if (stopping_ && workers_.empty())
    {
        io_context_.stop();
    }
}

void WorkerSupervisor::halt(int exit_status)
{
    stopping_ = true;
    exit_status_ = exit_status;

    for (const pid_t pid : workers_)
    {
        if (::kill(pid, SIGTERM) != 0 && errno != ESRCH)
        {
            tl::log::warn("Failed to signal worker " + std::to_string(pid) + ": " + std::strerror(errno));
        }
    }

    if (workers_.empty())
    {
        io_context_.stop();
    }
}
} // namespace tl
