/**
 * @file config_loader.cpp
 * @brief JSON loader (nlohmann::json) over named defaults.
 */
#include "swarm/config/config_loader.hpp"

#include <fstream>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>

#include "swarm/obs/log.hpp"

namespace swarm::config {

    using json = nlohmann::json;
    using swarm_detail::unexpected;

    std::string_view to_string(ConfigError e) noexcept {
        switch (e) {
            case ConfigError::NotFound:     return "not_found";
            case ConfigError::ParseError:   return "parse_error";
            case ConfigError::InvalidValue: return "invalid_value";
        }
        return "unknown";
    }

    namespace {

    /// Field readers: absent key = keep default; wrong type = invalid.
    class Reader {
    public:
        explicit Reader(const json& obj) : obj_(obj) {}

        void u32(const char* key, uint32_t& out, uint32_t min = 0,
                 uint32_t max = std::numeric_limits<uint32_t>::max()) {
            const auto* v = find(key);
            if (!v) return;
            if (!v->is_number_unsigned()) { fail(key); return; }
            const auto n = v->get<uint64_t>();
            if (n < min || n > max) { fail(key); return; }
            out = static_cast<uint32_t>(n);
        }

        void i32(const char* key, int32_t& out, int32_t min) {
            const auto* v = find(key);
            if (!v) return;
            if (!v->is_number_integer()) { fail(key); return; }
            const auto n = v->get<int64_t>();
            if (n < min || n > std::numeric_limits<int32_t>::max()) { fail(key); return; }
            out = static_cast<int32_t>(n);
        }

        void probability(const char* key, double& out) {
            const auto* v = find(key);
            if (!v) return;
            if (!v->is_number()) { fail(key); return; }
            const auto p = v->get<double>();
            if (p < 0.0 || p > 1.0) { fail(key); return; }
            out = p;
        }

        void boolean(const char* key, bool& out) {
            const auto* v = find(key);
            if (!v) return;
            if (!v->is_boolean()) { fail(key); return; }
            out = v->get<bool>();
        }

        void string(const char* key, std::string& out) {
            const auto* v = find(key);
            if (!v) return;
            if (!v->is_string()) { fail(key); return; }
            out = v->get<std::string>();
        }

        /// Nested object reader; absent = empty reader, non-object = invalid.
        Reader section(const char* key) {
            const auto* v = find(key);
            if (!v) return Reader(empty());
            if (!v->is_object()) { fail(key); return Reader(empty()); }
            Reader r(*v);
            r.parent_ = this;
            return r;
        }

        [[nodiscard]] bool ok() const noexcept { return ok_; }
        void fail(const char* key) {
            obs::logger()->warn("config: invalid value for '{}'", key);
            ok_ = false;
            if (parent_) parent_->ok_ = false;
        }

    private:
        static const json& empty() {
            static const json e = json::object();
            return e;
        }
        const json* find(const char* key) const {
            const auto it = obj_.find(key);
            return it == obj_.end() ? nullptr : &*it;
        }

        const json& obj_;
        Reader* parent_{nullptr};
        bool ok_{true};
    };

    constexpr uint32_t kMaxBackoffExponent = 30;

    } // namespace

    MeshConfig Loader::defaults() {
        return MeshConfig{}; // every field picks its default from constants
    }

    swarm_detail::expected<MeshConfig, ConfigError> Loader::load_from_string(std::string_view text) {
        json doc;
        try {
            doc = json::parse(text);
        } catch (const json::parse_error& e) {
            obs::logger()->warn("config: parse error: {}", e.what());
            return unexpected<ConfigError>(ConfigError::ParseError);
        }
        if (!doc.is_object()) return unexpected<ConfigError>(ConfigError::InvalidValue);

        MeshConfig cfg = defaults();
        Reader root(doc);

        root.string("device_name", cfg.device_name);
        // Absent means "set later"; present must name someone.
        if (doc.contains("device_name") && cfg.device_name.empty()) root.fail("device_name");
        root.string("log_level", cfg.log_level);
        if (!obs::is_valid_level(cfg.log_level)) root.fail("log_level");
        root.u32("max_connections", cfg.max_connections, 1);

        std::string strategy(topology::to_string(cfg.strategy));
        root.string("strategy", strategy);
        if (const auto kind = topology::strategy_from_string(strategy)) {
            cfg.strategy = *kind;
        } else {
            root.fail("strategy");
        }

        {
            auto b = root.section("base");
            auto& c = cfg.strategies.base;
            b.u32("manage_period_ms", c.manage_period_ms, 1);
            b.u32("rotation_period_ms", c.rotation_period_ms, 1);
            b.u32("rotation_jitter_max_ms", c.rotation_jitter_max_ms);
            b.boolean("rotation_enabled", c.rotation_enabled);
        }
        {
            auto r = root.section("ring");
            auto& c = cfg.strategies.ring;
            r.u32("stability_debounce_ms", c.stability_debounce_ms);
            r.u32("reevaluate_period_ms", c.reevaluate_period_ms, 1);
            r.u32("backoff_base_ms", c.backoff_base_ms);
            r.u32("backoff_max_exponent", c.backoff_max_exponent, 1, kMaxBackoffExponent);
            r.u32("backoff_jitter_max_ms", c.backoff_jitter_max_ms);
            r.u32("min_opposite_distance", c.min_opposite_distance, 1);
            r.boolean("reduce_discovery_when_stable", c.reduce_discovery_when_stable);
        }
        {
            auto r = root.section("random");
            auto& c = cfg.strategies.random;
            r.u32("loop_period_ms", c.loop_period_ms, 1);
            r.u32("loop_jitter_max_ms", c.loop_jitter_max_ms);
            r.probability("churn_probability", c.churn_probability);
            r.u32("backoff_base_ms", c.backoff_base_ms);
            r.u32("backoff_max_exponent", c.backoff_max_exponent, 0, kMaxBackoffExponent);
        }
        {
            auto g = root.section("gossip");
            g.u32("period_ms", cfg.gossip.period_ms, 1);
        }
        {
            auto h = root.section("healing");
            h.u32("discovery_window_ms", cfg.healing.discovery_window_ms, 1);
            h.u32("advertising_window_ms", cfg.healing.advertising_window_ms, 1);
        }
        {
            auto f = root.section("flood");
            f.i32("default_ttl", cfg.flood.default_ttl, 1);
            f.u32("seen_ttl_ms", cfg.flood.seen_ttl_ms, 1);
        }
        {
            auto w = root.section("watchdog");
            auto& c = cfg.watchdog;
            w.u32("sweep_period_ms", c.sweep_period_ms, 1);
            w.u32("discovered_ms", c.discovered_ms);
            w.u32("connecting_ms", c.connecting_ms);
            w.u32("connected_ms", c.connected_ms);
            w.u32("disconnected_ms", c.disconnected_ms);
            w.u32("error_ms", c.error_ms);
        }

        if (!root.ok()) return unexpected<ConfigError>(ConfigError::InvalidValue);
        return cfg;
    }

    swarm_detail::expected<MeshConfig, ConfigError> Loader::load_from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            obs::logger()->warn("config: cannot open {}", path);
            return unexpected<ConfigError>(ConfigError::NotFound);
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        return load_from_string(ss.str());
    }

} // namespace swarm::config
