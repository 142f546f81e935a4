#pragma once
/**
 * @file healing_service.hpp
 * @brief Global healing: alternate discovery and advertising windows forever.
 * @details Keeps discovery from running permanently while still letting split
 *          partitions find each other again.
 */

#include <atomic>
#include <cstdint>
#include <stop_token>

#include "swarm/config/constants.hpp"
#include "swarm/obs/observability.hpp"
#include "swarm/sched/task_group.hpp"
#include "swarm/transport/transport.hpp"

namespace swarm::healing {

/** @struct HealingConfig
 *  @brief Window lengths of one healing cycle.
 */
struct HealingConfig {
    uint32_t discovery_window_ms{config::constants::HEAL_DISCOVERY_WINDOW_MS};     ///< scan phase
    uint32_t advertising_window_ms{config::constants::HEAL_ADVERTISING_WINDOW_MS}; ///< advertise-only phase
};

class HealingService final {
public:
    HealingService(transport::Transport& transport, obs::Observer& observer, HealingConfig cfg = {})
        : transport_(transport), observer_(observer), cfg_(cfg) {}
    ~HealingService() { stop(); }

    HealingService(const HealingService&)            = delete;
    HealingService& operator=(const HealingService&) = delete;

    void start();
    void stop();

    /**
     * @brief One full cycle: discover, stop all, advertise, wait.
     * @return false if stop was requested part way.
     */
    bool run_cycle(std::stop_token st);

    [[nodiscard]] uint64_t cycles() const noexcept { return cycles_.load(std::memory_order_relaxed); }

private:
    transport::Transport& transport_;
    obs::Observer& observer_;
    HealingConfig cfg_;
    sched::TaskGroup tasks_{"healing"};
    std::atomic<uint64_t> cycles_{0};
};

} // namespace swarm::healing
