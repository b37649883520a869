#ifndef GENERATOR_H
#define GENERATOR_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include <boost/variant.hpp>

#include "overridable_strategy.hpp"
#include "seeded_strategy.hpp"

namespace compat_rand {

enum struct strategy_kind {
  seeded,
  overridable,
};

/* Deterministic, non-cryptographic pseudo-random number generator that
 * reproduces the historical subtractive sequence for a seed.
 *
 * Every operation is virtual.  With strategy_kind::overridable, the composite
 * operations call back through sample(), next() and next(max_value), so a
 * subclass that replaces one of those primitives changes everything derived
 * from it.  With strategy_kind::seeded, the operations read the engine
 * directly and replacing a primitive only changes that primitive.
 *
 * A generator must not be used from several threads at once.  It is neither
 * copyable nor movable because the overridable strategy refers back to it. */
class generator : public sample_source {
 public:
  // Overridable strategy with a seed from shared_seed::next().
  generator();
  explicit generator(int32_t seed, strategy_kind kind = strategy_kind::seeded);
  generator(const generator&) = delete;
  generator& operator=(const generator&) = delete;
  ~generator() override = default;

  strategy_kind kind() const;
  int32_t get_seed() const;

  // [0, 1)
  double sample() override;
  // [0, INT32_MAX)
  int32_t next() override;
  // [0, max_value).  Throws argument_error if max_value < 0.
  int32_t next(int32_t max_value) override;
  // [min_value, max_value).  Throws argument_error if min_value > max_value.
  virtual int32_t next(int32_t min_value, int32_t max_value);
  // [0, INT64_MAX)
  virtual int64_t next_int64();
  virtual int64_t next_int64(int64_t max_value);
  virtual int64_t next_int64(int64_t min_value, int64_t max_value);
  virtual double next_double();
  virtual float next_single();
  virtual void next_bytes(std::vector<uint8_t>& buffer);
  // Throws argument_error if buffer is null and length is not 0.
  virtual void next_bytes(uint8_t* buffer, size_t length);

 private:
  boost::variant<seeded_strategy, overridable_strategy> impl;
};

} // namespace compat_rand

#endif //GENERATOR_H
