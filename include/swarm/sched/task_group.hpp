#pragma once
/**
 * @file task_group.hpp
 * @brief Owner of a component's long-lived tasks with cooperative cancellation.
 *
 * Every task receives the group's std::stop_token and is expected to suspend
 * only through sleep_for() or stop-aware waits so that stop() returns promptly.
 *
 * Thread-safety: spawn/stop/wait_idle may be called from any thread, but never
 * from inside a task of the same group (stop() joins).
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

namespace swarm::sched {

class TaskGroup final {
public:
    using TaskFn = std::function<void(std::stop_token)>;

    /// @param name Label used in logs ("ring", "gossip", ...).
    explicit TaskGroup(std::string name);
    ~TaskGroup();

    TaskGroup(const TaskGroup&)            = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    /**
     * @brief Launch @p fn on its own thread.
     * @return false if the group is closed (stopped and not reopened).
     */
    bool spawn(TaskFn fn);

    /// Request stop on every task, join them all, and close the group.
    void stop();

    /// Reopen a stopped group with a fresh stop source.
    void reopen();

    /// Block until no task is running (tests, orderly shutdown).
    void wait_idle();

    /// Number of tasks that have not finished yet.
    [[nodiscard]] std::size_t active() const;

    [[nodiscard]] bool is_open() const;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /**
     * @brief Stop-aware sleep.
     * @return true if the full duration elapsed; false if stop was requested.
     */
    static bool sleep_for(std::stop_token st, std::chrono::milliseconds d);

private:
    struct Task {
        std::thread thread;
        std::shared_ptr<bool> done; ///< Guarded by mu_.
    };

    /// Join threads that already finished. Caller holds mu_ via @p lk.
    void reap(std::unique_lock<std::mutex>& lk);

    std::string name_;
    mutable std::mutex mu_;
    std::condition_variable idle_cv_;
    std::list<Task> tasks_;
    std::stop_source source_;
    std::size_t active_{0};
    bool open_{true};
};

} // namespace swarm::sched
