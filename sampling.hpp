#ifndef SAMPLING_H
#define SAMPLING_H

#include <cstdint>
#include <limits>

#include <boost/integer/integer_log2.hpp>

// Formulas shared by the seeded and overridable strategies.  They are written
// against callables so that each strategy decides where the underlying
// primitive comes from.
namespace compat_rand {
namespace sampling {

// The largest range that next(min, max) scales with a plain sample().
constexpr int64_t max_small_range = std::numeric_limits<int32_t>::max();

inline int64_t int32_range(int32_t min_value, int32_t max_value) {
  return static_cast<int64_t>(max_value) - min_value;
}

// Truncates toward zero.  sample * max_value is below 2^31 so the integer part
// is exact.
inline int32_t scale(double sample, int32_t max_value) {
  return static_cast<int32_t>(sample * max_value);
}

inline int32_t scale(double sample, int64_t range, int32_t min_value) {
  return static_cast<int32_t>(sample * range) + min_value;
}

inline int32_t scale_large(double sample, int64_t range, int32_t min_value) {
  return static_cast<int32_t>(static_cast<int64_t>(sample * range) + min_value);
}

// Smallest number of bits that can hold value - 1, for value > 1.
inline int log2_ceiling(uint64_t value) {
  return boost::integer_log2(value - 1) + 1;
}

// Builds a full 64-bit value out of three bounded draws of 22, 22 and 20 bits.
// The draws are made in that order.
template <typename bounded_next_t>
uint64_t compose_uint64(bounded_next_t&& bounded_next) {
  uint64_t const low = static_cast<uint32_t>(bounded_next(1 << 22));
  uint64_t const mid = static_cast<uint32_t>(bounded_next(1 << 22));
  uint64_t const high = static_cast<uint32_t>(bounded_next(1 << 20));
  return low | (mid << 22) | (high << 44);
}

// Returns a value in [0, INT64_MAX).  INT64_MAX itself is rejected and drawn
// again.
template <typename uint64_next_t>
int64_t non_negative_int64(uint64_next_t&& next_uint64) {
  constexpr uint64_t excluded = std::numeric_limits<int64_t>::max();
  while (true) {
    uint64_t const result = next_uint64() >> 1;
    if (result != excluded) {
      return static_cast<int64_t>(result);
    }
  }
}

// Returns a value in [min_value, max_value), or min_value when the range holds
// at most one value.  Draws are cut down to the smallest power of two covering
// the range and rejected until one falls inside it.
template <typename uint64_next_t>
int64_t ranged_int64(int64_t min_value, int64_t max_value, uint64_next_t&& next_uint64) {
  uint64_t const exclusive_range = static_cast<uint64_t>(max_value) - static_cast<uint64_t>(min_value);
  if (exclusive_range > 1) {
    int const bits = log2_ceiling(exclusive_range);
    while (true) {
      uint64_t const result = next_uint64() >> (64 - bits);
      if (result < exclusive_range) {
        return static_cast<int64_t>(result + static_cast<uint64_t>(min_value));
      }
    }
  }
  return min_value;
}

// Narrowing to float can round a value just below 1 up to 1.0f, which is
// rejected.
template <typename sample_t>
float single(sample_t&& sample) {
  while (true) {
    float const f = static_cast<float>(sample());
    if (f < 1.0f) {
      return f;
    }
  }
}

} // namespace sampling
} // namespace compat_rand

#endif //SAMPLING_H
