#pragma once

#include <sys/types.h>

#include <functional>
#include <set>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

namespace tl
{
// Exit status of a worker whose model never loaded or whose listener could
// not be opened. The supervisor stops instead of respawning it.
constexpr int kWorkerBootFailure = 3;

// min(hint, max) when a hint is given, else min(2 * cores + 1, max); never 0.
unsigned resolve_worker_count(unsigned hint, unsigned max, unsigned cores);

using WorkerEntry = std::function<int()>;

class WorkerSupervisor
{
public:
    WorkerSupervisor(unsigned worker_count, WorkerEntry entry);

    WorkerSupervisor(const WorkerSupervisor &) = delete;
    WorkerSupervisor &operator=(const WorkerSupervisor &) = delete;

    // Forks the workers and supervises them until a shutdown signal or a boot
    // failure. Returns the status for the supervisor process.
    int run();

private:
    void spawn();
    void wait_for_signal();
    void on_signal(int signal_number);
    void reap();
    void halt(int exit_status);

    boost::asio::io_context io_context_;
    boost::asio::signal_set signals_;
    unsigned worker_count_;
    WorkerEntry entry_;
    std::set<pid_t> workers_;
    bool stopping_{false};
    int exit_status_{0};
};
} // namespace tl
