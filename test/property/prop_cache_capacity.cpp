/**
 * @file  prop_cache_capacity.cpp
 * @brief Property: ∀ sequence of set/get/remove operations on an
 *        InProcessCache of capacity C, size() ≤ C after every step, and a
 *        key just written is readable until something else displaces it.
 *
 * Run with 2,000 random inputs:
 *   RC_PARAMS="max_success=2000" ./prop_cache_capacity
 *
 * Eviction accounting is checked alongside: every drop is also an
 * eviction, and nothing is dropped while no cache-only entry was stored.
 */

#include <rapidcheck.h>

#include <string>
#include <vector>

#include "umb/cache.hpp"

using namespace umb;
using namespace umb::cache;

namespace {

struct Op {
    int         kind = 0;  ///< 0 set, 1 get, 2 remove
    std::string key;
    bool        durable_backed = false;
};

rc::Gen<Op> op_gen() {
    return rc::gen::build<Op>(
        rc::gen::set(&Op::kind, rc::gen::inRange(0, 3)),
        rc::gen::set(&Op::key, rc::gen::map(rc::gen::inRange(0, 64),
                                            [](int k) { return "k" + std::to_string(k); })),
        rc::gen::set(&Op::durable_backed, rc::gen::arbitrary<bool>()));
}

} // anonymous namespace

int main() {
    // ── Property 1: size bound holds after every operation ───────────────────
    rc::check(
        "cache_capacity: size() <= capacity() after every operation",
        [] {
            const auto capacity = *rc::gen::inRange<std::size_t>(1, 32);
            const auto ops      = *rc::gen::container<std::vector<Op>>(op_gen());

            InProcessCache cache(capacity, Millis{0});
            for (const auto& op : ops) {
                switch (op.kind) {
                    case 0: {
                        RC_ASSERT(cache.set(op.key, "v:" + op.key, std::nullopt,
                                            op.durable_backed) == CacheStatus::Ok);
                        const auto got = cache.get(op.key);
                        RC_ASSERT(got.hit());
                        RC_ASSERT(got.value == "v:" + op.key);
                        break;
                    }
                    case 1:
                        (void)cache.get(op.key);
                        break;
                    default:
                        RC_ASSERT(cache.remove(op.key) == CacheStatus::Ok);
                        RC_ASSERT(cache.get(op.key).status == CacheStatus::Miss);
                        break;
                }
                RC_ASSERT(cache.size() <= cache.capacity());
            }
        }
    );

    // ── Property 2: drops only count cache-only entries ──────────────────────
    rc::check(
        "cache_capacity: all-durable workload never drops, drops <= evictions",
        [] {
            const auto capacity = *rc::gen::inRange<std::size_t>(1, 16);
            const auto n        = *rc::gen::inRange(0, 200);
            const bool durable  = *rc::gen::arbitrary<bool>();

            InProcessCache cache(capacity, Millis{0});
            for (int i = 0; i < n; ++i) {
                (void)cache.set("k" + std::to_string(i), "v", std::nullopt, durable);
            }
            const auto st = cache.stats();
            RC_ASSERT(st.drops <= st.evictions);
            RC_ASSERT(st.entries == cache.size());
            if (durable) {
                RC_ASSERT(st.drops == 0u);
            }
            const auto expected_evictions =
                n > static_cast<int>(capacity) ? static_cast<std::uint64_t>(n) - capacity : 0u;
            RC_ASSERT(st.evictions == expected_evictions);
        }
    );

    return 0;
}
