#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: named defaults, optionally overridden by a JSON file.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <cstdint>
#include <string>
#include <string_view>

#include "swarm/compat/expected.hpp"
#include "swarm/config/constants.hpp"
#include "swarm/gossip/gossip_manager.hpp"
#include "swarm/healing/healing_service.hpp"
#include "swarm/routing/flood_router.hpp"
#include "swarm/state/mesh_state.hpp"
#include "swarm/topology/strategy_factory.hpp"

namespace swarm::config {

    /** @struct MeshConfig
     *  @brief Aggregate of everything one node needs.
     */
    struct MeshConfig {
        std::string                   device_name;                                   ///< Local identity (required to run)
        swarm::topology::StrategyKind strategy{swarm::topology::StrategyKind::Base}; ///< Active strategy
        std::string                   log_level{"info"};                             ///< spdlog level name
        uint32_t                      max_connections{constants::MAX_CONNECTIONS};   ///< Shared capacity
        swarm::topology::StrategySettings strategies;                                ///< Base / ring / random knobs
        swarm::gossip::GossipConfig       gossip;
        swarm::healing::HealingConfig     healing;
        swarm::routing::FloodConfig       flood;
        swarm::state::WatchdogConfig      watchdog;
    };

    /** @enum ConfigError
     *  @brief Why a configuration file was refused.
     */
    enum class ConfigError : uint8_t {
        NotFound,     ///< File missing or unreadable
        ParseError,   ///< Not valid JSON
        InvalidValue  ///< Known key with a wrong type or out-of-range value
    };

    std::string_view to_string(ConfigError e) noexcept;

    /** @class Loader
     *  @brief Source of node configuration (defaults or parsed files).
     */
    class Loader {
    public:
        /// Defaults from constants.hpp.
        static MeshConfig defaults();

        /**
         * @brief Parse a JSON document over the defaults.
         * @details Only keys present in the document are overridden; unknown
         *          keys are ignored. Times are in milliseconds.
         */
        static swarm_detail::expected<MeshConfig, ConfigError> load_from_string(std::string_view text);

        /// Read @p path and delegate to load_from_string().
        static swarm_detail::expected<MeshConfig, ConfigError> load_from_file(const std::string& path);
    };

} // namespace swarm::config
