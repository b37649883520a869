#include <cstdlib>
#include <limits>
#include <stdexcept>

#include "subtractive_engine.hpp"

namespace compat_rand {

namespace {

constexpr int32_t max_int32 = std::numeric_limits<int32_t>::max();
constexpr int32_t min_int32 = std::numeric_limits<int32_t>::min();

// Derived from the golden ratio.
constexpr int32_t magic_seed = 161803398;

// The state arithmetic wraps around on 32 bits.
inline int32_t wrapping_sub(int32_t a, int32_t b) {
  return static_cast<int32_t>(static_cast<uint32_t>(a) - static_cast<uint32_t>(b));
}

inline int32_t wrapping_add(int32_t a, int32_t b) {
  return static_cast<int32_t>(static_cast<uint32_t>(a) + static_cast<uint32_t>(b));
}

} // namespace

void subtractive_engine::initialize(int32_t seed) {
  std::array<int32_t, 56> state{};

  int32_t const subtraction = (seed == min_int32) ? max_int32 : std::abs(seed);
  int32_t mj = magic_seed - subtraction;
  state[55] = mj;
  int32_t mk = 1;

  // Slots 1..55 hold the state.  Slot 0 is never used.
  size_t ii = 0;
  for (size_t i = 1; i < 55; i++) {
    ii += 21;
    if (ii >= 55) {
      ii -= 55;
    }
    state[ii] = mk;
    mk = wrapping_sub(mj, mk);
    if (mk < 0) {
      mk = wrapping_add(mk, max_int32);
    }
    mj = state[ii];
  }

  for (int pass = 0; pass < 4; pass++) {
    for (size_t i = 1; i < 56; i++) {
      size_t n = i + 30;
      if (n >= 55) {
        n -= 55;
      }
      state[i] = wrapping_sub(state[i], state[1 + n]);
      if (state[i] < 0) {
        state[i] = wrapping_add(state[i], max_int32);
      }
    }
  }

  seed_array = state;
  inext = 0;
  inextp = 21;
}

int32_t subtractive_engine::internal_sample() {
  if (!seed_array) {
    throw std::logic_error("subtractive_engine sampled before initialization");
  }
  auto& state = *seed_array;

  size_t next = inext + 1;
  if (next >= 56) {
    next = 1;
  }
  size_t nextp = inextp + 1;
  if (nextp >= 56) {
    nextp = 1;
  }

  int32_t result = wrapping_sub(state[next], state[nextp]);
  if (result == max_int32) {
    result--;
  }
  if (result < 0) {
    result = wrapping_add(result, max_int32);
  }

  state[next] = result;
  inext = next;
  inextp = nextp;
  return result;
}

double subtractive_engine::sample() {
  return internal_sample() * (1.0 / max_int32);
}

double subtractive_engine::sample_for_large_range() {
  // sample() scaled onto [INT32_MIN, INT32_MAX) would only ever produce even
  // numbers, so draw a magnitude and then a sign.
  int32_t result = internal_sample();
  if (internal_sample() % 2 == 0) {
    result = -result;
  }
  double d = result;
  d += max_int32 - 1;  // [0, 2 * INT32_MAX - 1)
  d /= 2.0 * max_int32 - 1;
  return d;
}

void subtractive_engine::next_bytes(uint8_t* buffer, size_t length) {
  for (size_t i = 0; i < length; i++) {
    buffer[i] = static_cast<uint8_t>(internal_sample());
  }
}

} // namespace compat_rand
