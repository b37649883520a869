// Process-wide source of seeds for generators that are constructed without
// one.  It has an interface similar to srand() and rand().

#pragma once

#include <cstdint>

namespace compat_rand {
namespace shared_seed {

// Reseed the source so that subsequent unseeded generators are reproducible.
// A seed of 0 is replaced by 1.
void srand(uint32_t seed);

// Returns a seed in [0, INT32_MAX].  Safe to call from any thread.
int32_t next();

} // namespace shared_seed
} // namespace compat_rand
