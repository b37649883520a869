#ifndef SEEDED_STRATEGY_H
#define SEEDED_STRATEGY_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "subtractive_engine.hpp"

namespace compat_rand {

// Reproduces the historical sequence for an explicit seed.  The engine is
// initialized in the constructor and every operation reads straight from it.
//
// Arguments are assumed valid: max_value >= 0 and min_value <= max_value.
// generator checks them before calling in.  Not thread-safe.
class seeded_strategy {
 public:
  explicit seeded_strategy(int32_t seed);

  int32_t get_seed() const {
    return seed;
  }

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
  uint64_t next_uint64();

  int32_t seed;
  subtractive_engine engine;
};

} // namespace compat_rand

#endif //SEEDED_STRATEGY_H
