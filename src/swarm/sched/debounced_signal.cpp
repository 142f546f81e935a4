/**
 * @file debounced_signal.cpp
 * @brief Condition-variable backed implementation of DebouncedSignal.
 */
#include "swarm/sched/debounced_signal.hpp"

namespace swarm::sched {

bool DebouncedSignal::publish(bool value) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (value == value_) return false;
        value_ = value;
        ++generation_;
    }
    cv_.notify_all();
    return true;
}

DebouncedSignal::Sample DebouncedSignal::current() const {
    std::lock_guard<std::mutex> lk(mu_);
    return Sample{value_, generation_};
}

std::optional<DebouncedSignal::Sample>
DebouncedSignal::wait_next(std::stop_token st, uint64_t seen) {
    std::unique_lock<std::mutex> lk(mu_);
    if (!cv_.wait(lk, st, [&] { return generation_ != seen; })) return std::nullopt;
    return Sample{value_, generation_};
}

bool DebouncedSignal::wait_quiet(std::stop_token st, uint64_t seen, std::chrono::milliseconds quiet) {
    std::unique_lock<std::mutex> lk(mu_);
    const bool interrupted = cv_.wait_for(lk, st, quiet, [&] { return generation_ != seen; });
    return !interrupted && !st.stop_requested();
}

} // namespace swarm::sched
