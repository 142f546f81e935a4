/**
 * @file healing_service.cpp
 * @brief Discovery / advertising cycle.
 */
#include "swarm/healing/healing_service.hpp"

#include <chrono>

namespace swarm::healing {

using std::chrono::milliseconds;

void HealingService::start() {
    tasks_.reopen();
    tasks_.spawn([this](std::stop_token st) {
        while (run_cycle(st)) {
        }
    });
}

void HealingService::stop() { tasks_.stop(); }

bool HealingService::run_cycle(std::stop_token st) {
    if (st.stop_requested()) return false;
    observer_.record({obs::EventKind::HealingCycle, {}, "discovery"});
    transport_.start_discovery();
    if (!sched::TaskGroup::sleep_for(st, milliseconds{cfg_.discovery_window_ms})) return false;

    transport_.stop_all();
    transport_.start_advertising();
    observer_.record({obs::EventKind::HealingCycle, {}, "advertising"});
    const bool completed = sched::TaskGroup::sleep_for(st, milliseconds{cfg_.advertising_window_ms});
    if (completed) cycles_.fetch_add(1, std::memory_order_relaxed);
    return completed;
}

} // namespace swarm::healing
