/***
 * Name: GC controls API
 * Purpose: Configure and drive the garbage collector; access stats.
 * Theory of Operation:
 *   - Collection is synchronous and only happens in gc_collect() or at an explicit
 *     safe point (gc_maybe_collect()). Allocation never collects, so a fresh handle
 *     stays valid until the mutator reaches a safe point without rooting it.
 *   - Initial threshold comes from OBJKIT_GC_THRESHOLD (bytes), default 1 MiB.
 */
#pragma once

#include <cstddef>
#include "runtime/GCStats.h"

namespace objkit::rt {
    void gc_set_threshold(std::size_t bytes);

    std::size_t gc_threshold();

    void gc_collect();

    // Collects only when live bytes exceed the threshold. Returns true if a cycle ran.
    bool gc_maybe_collect();

    void gc_register_root(void **addr);

    void gc_unregister_root(void **addr);

    RuntimeStats gc_stats();

    // Frees every object, clears roots and stats, and re-reads OBJKIT_* configuration.
    void gc_reset_for_tests();
} // namespace objkit::rt
