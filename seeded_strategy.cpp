#include "logging.hpp"
#include "sampling.hpp"
#include "seeded_strategy.hpp"

namespace compat_rand {

seeded_strategy::seeded_strategy(int32_t seed) : seed(seed) {
  engine.ensure_initialized(seed);
  logger()->debug("seeded strategy initialized with seed {}", seed);
}

double seeded_strategy::sample() {
  return engine.sample();
}

int32_t seeded_strategy::next() {
  return engine.internal_sample();
}

int32_t seeded_strategy::next(int32_t max_value) {
  return sampling::scale(engine.sample(), max_value);
}

int32_t seeded_strategy::next(int32_t min_value, int32_t max_value) {
  auto const range = sampling::int32_range(min_value, max_value);
  if (range <= sampling::max_small_range) {
    return sampling::scale(engine.sample(), range, min_value);
  } else {
    return sampling::scale_large(engine.sample_for_large_range(), range, min_value);
  }
}

uint64_t seeded_strategy::next_uint64() {
  return sampling::compose_uint64([this](int32_t bound) { return next(bound); });
}

int64_t seeded_strategy::next_int64() {
  return sampling::non_negative_int64([this]() { return next_uint64(); });
}

int64_t seeded_strategy::next_int64(int64_t max_value) {
  return next_int64(0, max_value);
}

int64_t seeded_strategy::next_int64(int64_t min_value, int64_t max_value) {
  return sampling::ranged_int64(min_value, max_value, [this]() { return next_uint64(); });
}

double seeded_strategy::next_double() {
  return engine.sample();
}

float seeded_strategy::next_single() {
  return sampling::single([this]() { return engine.sample(); });
}

void seeded_strategy::next_bytes(std::vector<uint8_t>& buffer) {
  engine.next_bytes(buffer.data(), buffer.size());
}

void seeded_strategy::next_bytes(uint8_t* buffer, size_t length) {
  engine.next_bytes(buffer, length);
}

} // namespace compat_rand
