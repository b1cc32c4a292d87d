/**
 * @file  fuzz_entry_codec.cpp
 * @brief libFuzzer target for codec::decode_entry / codec::encode_entry
 *
 * Build:
 *   cmake -DUMB_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_entry_codec
 *
 * Run for 60 seconds with the JSON dictionary:
 *   ./fuzz_entry_codec -max_total_time=60 -dict=json.dict
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no exception escapes decode_entry.
 *   2. decode → encode → decode succeeds, and a second encode is
 *      byte-identical to the first (canonical form is a fixed point).
 *   3. decode_payload never throws, and an accepted payload re-encodes.
 *   4. A decoded Event entry either converts to an Event or is rejected,
 *      without throwing.
 *
 * Fuzzer strategy:
 *   The input bytes are a cache value as read back from the volatile cache,
 *   which another process may have written or truncated.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "umb/codec.hpp"

using namespace umb;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view text(reinterpret_cast<const char*>(data), size);

    if (const auto payload = codec::decode_payload(text)) {
        const auto wire = codec::encode_payload(*payload);
        assert(codec::decode_payload(wire).has_value());
    }

    const auto entry = codec::decode_entry(text);
    if (!entry) {
        return 0;
    }

    const std::string first = codec::encode_entry(*entry);
    const auto back = codec::decode_entry(first);
    assert(back.has_value());
    const std::string second = codec::encode_entry(*back);
    assert(first == second);

    if (entry->category == Category::Event) {
        (void)codec::event_from_entry(*entry);
    }

    return 0;
}
