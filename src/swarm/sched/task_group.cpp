/**
 * @file task_group.cpp
 * @brief Thread-per-task group with a shared stop source.
 */
#include "swarm/sched/task_group.hpp"

#include <utility>

namespace swarm::sched {

TaskGroup::TaskGroup(std::string name) : name_(std::move(name)) {}

TaskGroup::~TaskGroup() { stop(); }

bool TaskGroup::spawn(TaskFn fn) {
    std::unique_lock<std::mutex> lk(mu_);
    if (!open_) return false;
    reap(lk);

    auto done = std::make_shared<bool>(false);
    auto token = source_.get_token();
    ++active_;
    tasks_.push_back(Task{
        std::thread([this, done, token, fn = std::move(fn)]() mutable {
            fn(token);
            std::lock_guard<std::mutex> g(mu_);
            *done = true;
            --active_;
            idle_cv_.notify_all();
        }),
        done});
    return true;
}

void TaskGroup::stop() {
    std::list<Task> joining;
    {
        std::lock_guard<std::mutex> lk(mu_);
        open_ = false;
        source_.request_stop();
        joining.swap(tasks_);
    }
    for (auto& t : joining) {
        if (t.thread.joinable()) t.thread.join();
    }
}

void TaskGroup::reopen() {
    std::lock_guard<std::mutex> lk(mu_);
    if (open_) return;
    source_ = std::stop_source{};
    open_ = true;
}

void TaskGroup::wait_idle() {
    std::unique_lock<std::mutex> lk(mu_);
    idle_cv_.wait(lk, [this] { return active_ == 0; });
    reap(lk);
}

std::size_t TaskGroup::active() const {
    std::lock_guard<std::mutex> lk(mu_);
    return active_;
}

bool TaskGroup::is_open() const {
    std::lock_guard<std::mutex> lk(mu_);
    return open_;
}

bool TaskGroup::sleep_for(std::stop_token st, std::chrono::milliseconds d) {
    if (d.count() <= 0) return !st.stop_requested();
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lk(m);
    // Predicate never becomes true; we only wake on timeout or stop.
    cv.wait_for(lk, st, d, [] { return false; });
    return !st.stop_requested();
}

void TaskGroup::reap(std::unique_lock<std::mutex>&) {
    // A task marks itself done under mu_ and only returns afterwards, so
    // joining here never waits on a thread that needs the lock.
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (*it->done) {
            if (it->thread.joinable()) it->thread.join();
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace swarm::sched
