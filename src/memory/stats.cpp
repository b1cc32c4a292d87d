/// @file src/memory/stats.cpp
/// @brief Health-check renderings of memory::Stats.

#include "umb/memory.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <iterator>

namespace umb::memory {

Payload Stats::to_json() const {
    Payload counts(Json::objectValue);
    for (const auto& [category, n] : entry_counts) {
        counts[std::string(umb::to_string(category))] = static_cast<Json::Int64>(n);
    }

    return make_payload({
        {"hit_rate", hit_rate},
        {"miss_rate", miss_rate},
        {"cache_hits", static_cast<Json::Int64>(cache_hits)},
        {"cache_misses", static_cast<Json::Int64>(cache_misses)},
        {"degraded", degraded},
        {"cache_backend", cache_backend},
        {"fallback_entries", static_cast<Json::Int64>(fallback_entries)},
        {"evictions", static_cast<Json::Int64>(evictions)},
        {"drops", static_cast<Json::Int64>(drops)},
        {"writes", static_cast<Json::Int64>(writes)},
        {"partial_failures", static_cast<Json::Int64>(partial_failures)},
        {"failures", static_cast<Json::Int64>(failures)},
        {"events_published", static_cast<Json::Int64>(events_published)},
        {"handler_errors", static_cast<Json::Int64>(handler_errors)},
        {"entry_counts", std::move(counts)},
        {"database_size_bytes", database_size_bytes ? Payload(Json::Int64{*database_size_bytes})
                                                    : Payload(Json::nullValue)},
    });
}

std::string Stats::to_string() const {
    fmt::memory_buffer out;
    auto it = std::back_inserter(out);

    fmt::format_to(it, "Unified Memory Stats\n");
    fmt::format_to(it, "  Cache backend     : {}{}\n", cache_backend,
                   degraded ? " (DEGRADED)" : "");
    fmt::format_to(it, "  Hit rate          : {:.2f}%  ({} hits / {} misses)\n",
                   hit_rate * 100.0, cache_hits, cache_misses);
    fmt::format_to(it, "  Fallback entries  : {}\n", fallback_entries);
    fmt::format_to(it, "  Evictions / drops : {} / {}\n", evictions, drops);
    fmt::format_to(it, "  Writes            : {}  (partial {}, failed {})\n",
                   writes, partial_failures, failures);
    fmt::format_to(it, "  Events published  : {}  (handler errors {})\n",
                   events_published, handler_errors);
    fmt::format_to(it, "  Durable entries   :\n");
    for (const auto& [category, n] : entry_counts) {
        fmt::format_to(it, "    {:<16}: {}\n", umb::to_string(category), n);
    }
    if (database_size_bytes) {
        fmt::format_to(it, "  Database size     : {} bytes\n", *database_size_bytes);
    }
    return fmt::to_string(out);
}

} // namespace umb::memory
