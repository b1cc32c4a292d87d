/// @file src/core/config.cpp
/// @brief MemoryConfig loading (JSON file, environment) and validation.

#include "umb/config.hpp"
#include "umb/codec.hpp"
#include "umb/log.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <fstream>
#include <limits>
#include <sstream>
#include <type_traits>

namespace umb::core {

namespace {

const Payload* member(const Payload& json, const char* name) {
    return json.find(name, name + std::strlen(name));
}

/// Copy `json[name]` into `out` if present. Returns false on a type
/// mismatch or an integer that does not fit `T`.
template <typename T>
bool read_member(const Payload& json, const char* name, T& out) {
    const Payload* v = member(json, name);
    if (v == nullptr || v->isNull()) {
        return true;
    }
    if constexpr (std::is_same_v<T, std::string>) {
        if (!v->isString()) return false;
        out = v->asString();
    } else if constexpr (std::is_same_v<T, bool>) {
        if (!v->isBool()) return false;
        out = v->asBool();
    } else if constexpr (std::is_floating_point_v<T>) {
        if (!v->isNumeric()) return false;
        out = static_cast<T>(v->asDouble());
    } else {
        if (v->type() != Json::intValue && v->type() != Json::uintValue) return false;
        if constexpr (std::is_signed_v<T>) {
            if (!v->isInt64()) return false;
            const Json::Int64 raw = v->asInt64();
            if (raw < std::numeric_limits<T>::min() || raw > std::numeric_limits<T>::max()) {
                return false;
            }
            out = static_cast<T>(raw);
        } else {
            if (!v->isUInt64()) return false;
            const Json::UInt64 raw = v->asUInt64();
            if (raw > std::numeric_limits<T>::max()) return false;
            out = static_cast<T>(raw);
        }
    }
    return true;
}

template <typename Duration>
bool read_duration(const Payload& json, const char* name, Duration& out) {
    std::int64_t raw = out.count();
    if (!read_member(json, name, raw)) {
        return false;
    }
    out = Duration{raw};
    return true;
}

template <typename T>
std::optional<T> parse_number(const char* text) {
    T value{};
    const char* end = text + std::char_traits<char>::length(text);
    const auto [ptr, ec] = std::from_chars(text, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

/// Read an integer env var into `out`, recording a message on parse failure.
template <typename T>
void env_number(const char* name, T& out, std::vector<std::string>& errors) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return;
    }
    if (auto v = parse_number<T>(raw)) {
        out = *v;
    } else {
        errors.push_back(fmt::format("{}: '{}' is not a valid number", name, raw));
    }
}

void env_string(const char* name, std::string& out) {
    const char* raw = std::getenv(name);
    if (raw != nullptr && *raw != '\0') {
        out = raw;
    }
}

} // anonymous namespace

// ─── TtlConfig ────────────────────────────────────────────────────────────────

Seconds TtlConfig::for_category(Category c) const noexcept {
    switch (c) {
        case Category::MarketData:    return market_data;
        case Category::AgentDecision: return agent_decision;
        case Category::TradingSignal: return trading_signal;
        case Category::SystemState:   return system_state;
        case Category::Event:         return event;
    }
    return market_data;
}

// ─── apply_json ───────────────────────────────────────────────────────────────

std::optional<MemoryConfig>
apply_json(const MemoryConfig& base, const Payload& json) noexcept {
    try {
        if (!json.isObject()) {
            return std::nullopt;
        }
        MemoryConfig cfg = base;
        bool ok = read_member(json, "db_path", cfg.db_path)
               && read_member(json, "log_level", cfg.log_level)
               && read_member(json, "high_confidence_threshold",
                              cfg.high_confidence_threshold);

        if (const Payload* it = member(json, "cache"); ok && it != nullptr) {
            if (!it->isObject()) return std::nullopt;
            const Payload& c = *it;
            int port = cfg.cache.port;
            std::string password;
            ok = read_member(c, "host", cfg.cache.host)
              && read_member(c, "port", port)
              && read_member(c, "db", cfg.cache.db)
              && read_member(c, "namespace", cfg.cache.namespace_prefix)
              && read_member(c, "password", password)
              && read_member(c, "max_entries", cfg.cache.max_entries)
              && read_duration(c, "timeout_ms", cfg.cache.timeout)
              && read_duration(c, "reconnect_interval_ms", cfg.cache.reconnect_interval)
              && read_duration(c, "expiry_sweep_interval_ms", cfg.cache.expiry_sweep_interval);
            if (port < 0 || port > 65535) {
                return std::nullopt;
            }
            cfg.cache.port = static_cast<std::uint16_t>(port);
            if (!password.empty()) {
                cfg.cache.password = password;
            }
        }

        if (const Payload* it = member(json, "ttl"); ok && it != nullptr) {
            if (!it->isObject()) return std::nullopt;
            const Payload& t = *it;
            ok = read_duration(t, "market_data", cfg.ttl.market_data)
              && read_duration(t, "agent_decision", cfg.ttl.agent_decision)
              && read_duration(t, "trading_signal", cfg.ttl.trading_signal)
              && read_duration(t, "system_state", cfg.ttl.system_state)
              && read_duration(t, "event", cfg.ttl.event);
        }

        if (const Payload* it = member(json, "retention"); ok && it != nullptr) {
            if (!it->isObject()) return std::nullopt;
            const Payload& r = *it;
            ok = read_member(r, "days_to_keep", cfg.retention.days_to_keep)
              && read_member(r, "max_rows_per_category", cfg.retention.max_rows_per_category)
              && read_duration(r, "sweep_interval_s", cfg.retention.sweep_interval);
        }

        if (!ok) {
            return std::nullopt;
        }
        return cfg;
    } catch (const std::exception& ex) {
        log::error("config", "configuration rejected: {}", ex.what());
        return std::nullopt;
    }
}

// ─── load_config_file ─────────────────────────────────────────────────────────

std::optional<MemoryConfig> load_config_file(const std::string& path) noexcept {
    std::ifstream file(path);
    if (!file.is_open()) {
        log::error("config", "cannot open configuration file '{}'", path);
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    const std::string text = contents.str();

    const auto json = codec::decode_payload(text);
    if (!json) {
        log::error("config", "'{}' is not valid JSON", path);
        return std::nullopt;
    }

    auto cfg = apply_json(MemoryConfig{}, *json);
    if (!cfg) {
        log::error("config", "'{}' has a member of the wrong type", path);
    }
    return cfg;
}

// ─── apply_env ────────────────────────────────────────────────────────────────

void apply_env(MemoryConfig& config, std::vector<std::string>& errors) {
    env_string("UMB_DB_PATH", config.db_path);
    env_string("UMB_REDIS_HOST", config.cache.host);
    env_string("UMB_CACHE_NAMESPACE", config.cache.namespace_prefix);
    env_string("UMB_LOG_LEVEL", config.log_level);

    std::string password;
    env_string("UMB_REDIS_PASSWORD", password);
    if (!password.empty()) {
        config.cache.password = password;
    }

    env_number("UMB_REDIS_PORT", config.cache.port, errors);
    env_number("UMB_REDIS_DB", config.cache.db, errors);
    env_number("UMB_CACHE_MAX_ENTRIES", config.cache.max_entries, errors);
    env_number("UMB_DAYS_TO_KEEP", config.retention.days_to_keep, errors);

    std::int64_t timeout_ms = config.cache.timeout.count();
    env_number("UMB_CACHE_TIMEOUT_MS", timeout_ms, errors);
    config.cache.timeout = std::chrono::milliseconds{timeout_ms};
}

// ─── validate ─────────────────────────────────────────────────────────────────

std::vector<std::string> validate(const MemoryConfig& config) {
    std::vector<std::string> errors;

    if (config.db_path.empty()) {
        errors.emplace_back("db_path must not be empty");
    }
    if (!config.cache.host.empty() && config.cache.port == 0) {
        errors.emplace_back("cache.port must be in 1..65535");
    }
    if (config.cache.db < 0) {
        errors.emplace_back("cache.db must be >= 0");
    }
    if (config.cache.timeout.count() < 1 ||
        config.cache.timeout > constants::MAX_CACHE_TIMEOUT) {
        errors.push_back(fmt::format("cache.timeout_ms must be in 1..{}",
                                     constants::MAX_CACHE_TIMEOUT.count()));
    }
    if (config.cache.reconnect_interval.count() < 0) {
        errors.emplace_back("cache.reconnect_interval_ms must be >= 0");
    }
    if (config.cache.max_entries == 0) {
        errors.emplace_back("cache.max_entries must be > 0");
    }
    if (config.cache.namespace_prefix.empty()) {
        errors.emplace_back("cache.namespace must not be empty");
    }
    for (Category c : ALL_CATEGORIES) {
        if (config.ttl.for_category(c).count() <= 0) {
            errors.push_back(fmt::format("ttl.{} must be > 0", to_string(c)));
        }
    }
    if (config.retention.days_to_keep <= 0) {
        errors.emplace_back("retention.days_to_keep must be > 0");
    }
    if (config.retention.sweep_interval.count() < 0) {
        errors.emplace_back("retention.sweep_interval_s must be >= 0");
    }
    if (!(config.high_confidence_threshold >= 0.0 &&
          config.high_confidence_threshold <= 1.0)) {
        errors.emplace_back("high_confidence_threshold must be in [0, 1]");
    }
    if (!log::level_from_string(config.log_level)) {
        errors.push_back(fmt::format("log_level '{}' is not one of "
                                     "trace/debug/info/warn/error/off",
                                     config.log_level));
    }
    return errors;
}

// ─── to_json ──────────────────────────────────────────────────────────────────

Payload to_json(const MemoryConfig& config) {
    return make_payload({
        {"db_path", config.db_path},
        {"log_level", config.log_level},
        {"high_confidence_threshold", config.high_confidence_threshold},
        {"cache", make_payload({
            {"host", config.cache.host},
            {"port", config.cache.port},
            {"db", config.cache.db},
            {"namespace", config.cache.namespace_prefix},
            {"password", config.cache.password ? "***" : ""},
            {"timeout_ms", Json::Int64{config.cache.timeout.count()}},
            {"reconnect_interval_ms", Json::Int64{config.cache.reconnect_interval.count()}},
            {"max_entries", static_cast<Json::Int64>(config.cache.max_entries)},
            {"expiry_sweep_interval_ms", Json::Int64{config.cache.expiry_sweep_interval.count()}},
        })},
        {"ttl", make_payload({
            {"market_data", Json::Int64{config.ttl.market_data.count()}},
            {"agent_decision", Json::Int64{config.ttl.agent_decision.count()}},
            {"trading_signal", Json::Int64{config.ttl.trading_signal.count()}},
            {"system_state", Json::Int64{config.ttl.system_state.count()}},
            {"event", Json::Int64{config.ttl.event.count()}},
        })},
        {"retention", make_payload({
            {"days_to_keep", config.retention.days_to_keep},
            {"max_rows_per_category", static_cast<Json::Int64>(config.retention.max_rows_per_category)},
            {"sweep_interval_s", Json::Int64{config.retention.sweep_interval.count()}},
        })},
    });
}

} // namespace umb::core
