/// @file src/cache/redis_backend.cpp
/// @brief RedisBackend: CacheBackend over a redis-plus-plus client.

#include "umb/cache.hpp"
#include "umb/log.hpp"

#include <sw/redis++/redis++.h>

#include <fmt/core.h>

#include <algorithm>

namespace umb::cache {

namespace {

constexpr const char* kComponent = "redis";

sw::redis::ConnectionOptions connection_options(const RedisEndpoint& endpoint) {
    sw::redis::ConnectionOptions opts;
    opts.host            = endpoint.host;
    opts.port            = endpoint.port;
    opts.db              = endpoint.db;
    opts.connect_timeout = endpoint.timeout;
    opts.socket_timeout  = endpoint.timeout;
    if (endpoint.password) {
        opts.password = *endpoint.password;
    }
    return opts;
}

sw::redis::ConnectionPoolOptions pool_options(const RedisEndpoint& endpoint) {
    sw::redis::ConnectionPoolOptions pool;
    pool.size         = 1;
    pool.wait_timeout = endpoint.timeout;
    return pool;
}

} // anonymous namespace

// ─── Lifecycle ────────────────────────────────────────────────────────────────

RedisBackend::RedisBackend(const RedisEndpoint& endpoint)
    : address_(fmt::format("{}:{}", endpoint.host, endpoint.port))
    , redis_(std::make_unique<sw::redis::Redis>(connection_options(endpoint),
                                                pool_options(endpoint))) {}

RedisBackend::~RedisBackend() = default;

// ─── CacheBackend ─────────────────────────────────────────────────────────────

CacheStatus RedisBackend::set(const std::string& key, const std::string& value,
                              std::optional<Millis> ttl, bool /*durable_backed*/) {
    // A zero ttl means no expiry to redis++, so a live ttl is at least 1 ms.
    const Millis px = ttl ? std::max(*ttl, Millis{1}) : Millis{0};
    try {
        if (!redis_->set(key, value, px)) {
            log::warn(kComponent, "SET {} not applied by {}", key, address_);
            return CacheStatus::Unavailable;
        }
        return CacheStatus::Ok;
    } catch (const sw::redis::Error& e) {
        log::debug(kComponent, "SET {} on {}: {}", key, address_, e.what());
        return CacheStatus::Unavailable;
    }
}

CacheReply RedisBackend::get(const std::string& key) {
    try {
        auto value = redis_->get(key);
        if (!value) {
            return CacheReply{CacheStatus::Miss, {}};
        }
        return CacheReply{CacheStatus::Ok, std::move(*value)};
    } catch (const sw::redis::Error& e) {
        log::debug(kComponent, "GET {} on {}: {}", key, address_, e.what());
        return CacheReply{CacheStatus::Unavailable, {}};
    }
}

CacheStatus RedisBackend::remove(const std::string& key) {
    try {
        redis_->del(key);
        return CacheStatus::Ok;
    } catch (const sw::redis::Error& e) {
        log::debug(kComponent, "DEL {} on {}: {}", key, address_, e.what());
        return CacheStatus::Unavailable;
    }
}

bool RedisBackend::ping() {
    try {
        return redis_->ping() == "PONG";
    } catch (const sw::redis::Error& e) {
        log::debug(kComponent, "PING {}: {}", address_, e.what());
        return false;
    }
}

} // namespace umb::cache
