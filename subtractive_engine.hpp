#ifndef SUBTRACTIVE_ENGINE_H
#define SUBTRACTIVE_ENGINE_H

#include <array>
#include <cstddef>
#include <cstdint>

#include <boost/optional.hpp>

namespace compat_rand {

/* A modified version of Knuth's subtractive generator.  The sequence produced
 * for a given seed is fixed: callers persist seeds and expect to get the same
 * values back forever, so nothing here may change the output, including the
 * unused slot 0 of the state and the odd handling of INT32_MAX.
 *
 * The state is absent until ensure_initialized() is called and is never reset
 * afterwards.  Every sample mutates the state.  Not thread-safe. */
class subtractive_engine {
 public:
  subtractive_engine() = default;

  bool initialized() const {
    return static_cast<bool>(seed_array);
  }

  // Builds the state from seed unless it already exists.  Only the first call
  // has any effect.
  void ensure_initialized(int32_t seed) {
    if (!seed_array) {
      initialize(seed);
    }
  }

  // Returns a value in [0, INT32_MAX - 1].
  int32_t internal_sample();

  // Returns a value in [0, 1).
  double sample();

  // Returns a value in [0, 1) with enough resolution to scale onto a range
  // wider than INT32_MAX.  Consumes two samples.
  double sample_for_large_range();

  // Each byte is the low byte of one sample.
  void next_bytes(uint8_t* buffer, size_t length);

 private:
  void initialize(int32_t seed);

  boost::optional<std::array<int32_t, 56>> seed_array;
  size_t inext = 0;
  size_t inextp = 21;
};

} // namespace compat_rand

#endif //SUBTRACTIVE_ENGINE_H
