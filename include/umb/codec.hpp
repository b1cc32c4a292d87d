#pragma once

/// @file include/umb/codec.hpp
/// @brief Canonical byte form of Entries, Events and Payloads.
///
/// # Module: Codec
///
/// ## Responsibility
/// Serialize the shared value types to compact JSON for the durable payload
/// column and for cache values, and parse them back.
///
/// ## Canonical Form
/// `Json::Value` objects keep their keys ordered, so `encode_*` of equal
/// values yields byte-identical output. Doubles are written with 17
/// significant digits, non-ASCII as `\u` escapes (invalid UTF-8 becomes
/// U+FFFD). Timestamps are integer epoch microseconds.
///
/// Entry layout:
/// ```
/// {"category":"market_data","confidence":null,"created_at_us":1760000000000000,
///  "key":"EURUSD:bar:1","memory_type":"both","payload":{...},
///  "source":"trading","ttl_s":3600}
/// ```
///
/// ## Guarantees
/// - `decode_*` never throws; corrupt, truncated or mistyped input → nullopt
/// - Enum fields must carry a known name

#include "umb/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace umb::codec {

// ─── Payload ──────────────────────────────────────────────────────────────────

[[nodiscard]] std::string encode_payload(const Payload& payload);

/// Parse a JSON document. Returns nullopt on malformed text.
[[nodiscard]] std::optional<Payload> decode_payload(std::string_view text) noexcept;

// ─── Entry ────────────────────────────────────────────────────────────────────

[[nodiscard]] Payload                entry_to_json(const Entry& entry);
[[nodiscard]] std::optional<Entry>   entry_from_json(const Payload& json) noexcept;
[[nodiscard]] std::string            encode_entry(const Entry& entry);
[[nodiscard]] std::optional<Entry>   decode_entry(std::string_view text) noexcept;

// ─── Event ────────────────────────────────────────────────────────────────────

[[nodiscard]] Payload                event_to_json(const Event& event);
[[nodiscard]] std::optional<Event>   event_from_json(const Payload& json) noexcept;

/// View an Event as an Entry of category Event (key = event id,
/// payload = {event_type, event_data, target, processed}).
[[nodiscard]] Entry                  event_to_entry(const Event& event);

/// Inverse of `event_to_entry`. Returns nullopt for non-Event entries or a
/// payload without a string `event_type`.
[[nodiscard]] std::optional<Event>   event_from_entry(const Entry& entry) noexcept;

} // namespace umb::codec
