#ifndef OVERRIDABLE_STRATEGY_H
#define OVERRIDABLE_STRATEGY_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "subtractive_engine.hpp"

namespace compat_rand {

// The primitives that a caller may replace.  The overridable strategy calls
// back through these instead of reading its own engine, so a replacement is
// seen by every operation built on top of it.
class sample_source {
 public:
  virtual ~sample_source() = default;

  // Returns a value in [0, 1).
  virtual double sample() = 0;
  // Returns a value in [0, INT32_MAX).
  virtual int32_t next() = 0;
  // Returns a value in [0, max_value).
  virtual int32_t next(int32_t max_value) = 0;
};

/* Same operations and formulas as seeded_strategy, but
 *  - the engine is initialized on the first sampling call rather than in the
 *    constructor, and
 *  - wherever seeded_strategy reads sample(), next() or next(max) from the
 *    engine, this class reads them from the parent sample_source.
 *
 * With a parent that does not replace anything the output is identical to
 * seeded_strategy for the same seed.
 *
 * Two operations keep using the engine directly because they always have:
 * next(min, max) for ranges wider than INT32_MAX, and next_bytes() on a
 * vector.  next_bytes() on a raw buffer goes through the parent's next().
 *
 * The lazy initialization is a plain presence check.  Concurrent first use of
 * one instance is a data race, like any other concurrent use; callers must
 * synchronize or use one instance per thread. */
class overridable_strategy {
 public:
  // parent must outlive the strategy.
  overridable_strategy(sample_source& parent, int32_t seed);

  int32_t get_seed() const {
    return seed;
  }

  bool initialized() const {
    return engine.initialized();
  }

  // The engine's own primitives, used by a parent that does not replace them.
  double sample();
  int32_t next();
  int32_t next(int32_t max_value);
  int32_t next(int32_t min_value, int32_t max_value);
  int64_t next_int64();
  int64_t next_int64(int64_t max_value);
  int64_t next_int64(int64_t min_value, int64_t max_value);
  double next_double();
  float next_single();
  void next_bytes(std::vector<uint8_t>& buffer);
  void next_bytes(uint8_t* buffer, size_t length);

 private:
  subtractive_engine& ready_engine();
  uint64_t next_uint64();

  sample_source* parent;
  int32_t seed;
  subtractive_engine engine;
};

} // namespace compat_rand

#endif //OVERRIDABLE_STRATEGY_H
