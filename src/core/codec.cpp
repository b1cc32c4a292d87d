/// @file src/core/codec.cpp
/// @brief JSON codec for Entry / Event / Payload.

#include "umb/codec.hpp"

#include <chrono>
#include <cstring>
#include <exception>
#include <memory>

namespace umb::codec {

namespace {

const Json::StreamWriterBuilder& writer_builder() {
    static const Json::StreamWriterBuilder builder = [] {
        Json::StreamWriterBuilder b;
        b["indentation"]   = "";
        b["precision"]     = 17;
        b["precisionType"] = "significant";
        return b;
    }();
    return builder;
}

std::string dump_canonical(const Payload& json) {
    return Json::writeString(writer_builder(), json);
}

/// Member lookup that tolerates non-object input.
const Payload* member(const Payload& json, const char* name) {
    return json.isObject() ? json.find(name, name + std::strlen(name)) : nullptr;
}

bool is_integer(const Payload& v) noexcept {
    return v.type() == Json::intValue || v.type() == Json::uintValue;
}

/// Fetch a string member, or nullopt if absent or not a string.
std::optional<std::string> string_field(const Payload& json, const char* name) {
    const Payload* v = member(json, name);
    if (v == nullptr || !v->isString()) {
        return std::nullopt;
    }
    return v->asString();
}

/// Optional numeric member: absent or null → engaged-empty, wrong type → failure.
/// Returns {ok, value}.
std::pair<bool, std::optional<double>> nullable_number(const Payload& json, const char* name) {
    const Payload* v = member(json, name);
    if (v == nullptr || v->isNull()) {
        return {true, std::nullopt};
    }
    if (!v->isNumeric()) {
        return {false, std::nullopt};
    }
    return {true, v->asDouble()};
}

std::optional<std::int64_t> integer_field(const Payload& json, const char* name) {
    const Payload* v = member(json, name);
    if (v == nullptr || !is_integer(*v) || !v->isInt64()) {
        return std::nullopt;
    }
    return v->asInt64();
}

/// Epoch microseconds that fit a Timestamp without overflow.
std::optional<std::int64_t> timestamp_field(const Payload& json, const char* name) {
    static const std::int64_t limit =
        std::chrono::duration_cast<std::chrono::microseconds>(Clock::duration::max()).count();
    const auto us = integer_field(json, name);
    if (!us || *us > limit || *us < -limit) {
        return std::nullopt;
    }
    return us;
}

Payload target_json(const std::optional<Source>& target) {
    return target ? Payload(std::string(to_string(*target))) : Payload(Json::nullValue);
}

} // anonymous namespace

// ─── Payload ──────────────────────────────────────────────────────────────────

std::string encode_payload(const Payload& payload) {
    return dump_canonical(payload);
}

std::optional<Payload> decode_payload(std::string_view text) noexcept {
    try {
        static const Json::CharReaderBuilder builder = [] {
            Json::CharReaderBuilder b;
            Json::CharReaderBuilder::strictMode(&b.settings_);
            b["strictRoot"]    = false;
            b["rejectDupKeys"] = false;
            return b;
        }();
        const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        Payload     parsed;
        std::string errors;
        if (!reader->parse(text.data(), text.data() + text.size(), &parsed, &errors)) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ─── Entry ────────────────────────────────────────────────────────────────────

Payload entry_to_json(const Entry& entry) {
    Payload json(Json::objectValue);
    json["category"]      = std::string(to_string(entry.category));
    json["key"]           = entry.key;
    json["payload"]       = entry.payload;
    json["source"]        = std::string(to_string(entry.source));
    json["memory_type"]   = std::string(to_string(entry.memory_type));
    json["created_at_us"] = Json::Int64{to_epoch_micros(entry.created_at)};
    json["ttl_s"]         = entry.ttl ? Payload(Json::Int64{entry.ttl->count()})
                                      : Payload(Json::nullValue);
    json["confidence"]    = entry.confidence ? Payload(*entry.confidence)
                                             : Payload(Json::nullValue);
    return json;
}

std::optional<Entry> entry_from_json(const Payload& json) noexcept {
    try {
        if (!json.isObject()) {
            return std::nullopt;
        }

        const auto category    = string_field(json, "category");
        const auto key         = string_field(json, "key");
        const auto source      = string_field(json, "source");
        const auto memory_type = string_field(json, "memory_type");
        const auto created_at  = timestamp_field(json, "created_at_us");
        if (!category || !key || !source || !memory_type || !created_at) {
            return std::nullopt;
        }

        Entry entry;
        const auto cat = category_from_string(*category);
        const auto src = source_from_string(*source);
        const auto mem = memory_type_from_string(*memory_type);
        if (!cat || !src || !mem) {
            return std::nullopt;
        }
        entry.category    = *cat;
        entry.key         = *key;
        entry.source      = *src;
        entry.memory_type = *mem;
        entry.created_at  = from_epoch_micros(*created_at);

        const Payload* payload = member(json, "payload");
        if (payload == nullptr || !payload->isObject()) {
            return std::nullopt;
        }
        entry.payload = *payload;

        const Payload* ttl = member(json, "ttl_s");
        if (ttl != nullptr && !ttl->isNull()) {
            if (!is_integer(*ttl) || !ttl->isInt64() || ttl->asInt64() <= 0) {
                return std::nullopt;
            }
            entry.ttl = Seconds{ttl->asInt64()};
        }

        const auto [conf_ok, confidence] = nullable_number(json, "confidence");
        if (!conf_ok) {
            return std::nullopt;
        }
        entry.confidence = confidence;

        return entry;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string encode_entry(const Entry& entry) {
    return dump_canonical(entry_to_json(entry));
}

std::optional<Entry> decode_entry(std::string_view text) noexcept {
    auto json = decode_payload(text);
    if (!json) {
        return std::nullopt;
    }
    return entry_from_json(*json);
}

// ─── Event ────────────────────────────────────────────────────────────────────

Payload event_to_json(const Event& event) {
    Payload json(Json::objectValue);
    json["id"]            = event.id;
    json["event_type"]    = event.event_type;
    json["event_data"]    = event.event_data;
    json["source"]        = std::string(to_string(event.source));
    json["target"]        = target_json(event.target);
    json["created_at_us"] = Json::Int64{to_epoch_micros(event.created_at)};
    json["processed"]     = event.processed;
    return json;
}

std::optional<Event> event_from_json(const Payload& json) noexcept {
    try {
        if (!json.isObject()) {
            return std::nullopt;
        }
        const auto id         = string_field(json, "id");
        const auto event_type = string_field(json, "event_type");
        const auto source     = string_field(json, "source");
        const auto created_at = timestamp_field(json, "created_at_us");
        if (!id || !event_type || !source || !created_at) {
            return std::nullopt;
        }
        const auto src = source_from_string(*source);
        if (!src) {
            return std::nullopt;
        }

        Event event;
        event.id         = *id;
        event.event_type = *event_type;
        event.source     = *src;
        event.created_at = from_epoch_micros(*created_at);

        if (const Payload* data = member(json, "event_data")) {
            event.event_data = *data;
        }

        const Payload* target = member(json, "target");
        if (target != nullptr && !target->isNull()) {
            if (!target->isString()) {
                return std::nullopt;
            }
            const auto tgt = source_from_string(target->asString());
            if (!tgt) {
                return std::nullopt;
            }
            event.target = *tgt;
        }

        const Payload* processed = member(json, "processed");
        if (processed != nullptr && processed->isBool()) {
            event.processed = processed->asBool();
        }
        return event;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

Entry event_to_entry(const Event& event) {
    Entry entry;
    entry.category    = Category::Event;
    entry.key         = event.id;
    entry.source      = event.source;
    entry.memory_type = MemoryType::PersistentOnly;
    entry.created_at  = event.created_at;
    entry.payload     = make_payload({
        {"event_type", event.event_type},
        {"event_data", event.event_data},
        {"target",     target_json(event.target)},
        {"processed",  event.processed},
    });
    return entry;
}

std::optional<Event> event_from_entry(const Entry& entry) noexcept {
    if (entry.category != Category::Event || !entry.payload.isObject()) {
        return std::nullopt;
    }
    try {
        Payload json   = entry.payload;
        json["id"]     = entry.key;
        json["source"] = std::string(to_string(entry.source));
        json["created_at_us"] = Json::Int64{to_epoch_micros(entry.created_at)};
        return event_from_json(json);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace umb::codec
