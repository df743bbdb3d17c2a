#pragma once

#include <vector>

#include "accretion/core/deterministic_rng.hpp"
#include "accretion/core/events.hpp"

/**
 * @struct TickContext
 * @brief Per-tick scratch shared by the systems of one step.
 */
struct TickContext {
    DeterministicRng& rng;
    EventLog& log;

    // Intents generated during this tick, applied at the start of the next one
    std::vector<IntentEvent> deferredIntents;

    // Set by any system that added, removed or moved bodies outside the integrator
    bool registryMutated = false;

    // Set when a resolution produced an invalid body; the run must be reset
    bool consistencyFailure = false;

    TickContext(DeterministicRng& r, EventLog& l) : rng(r), log(l) {}
};
