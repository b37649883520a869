#include "logging.hpp"
#include "overridable_strategy.hpp"
#include "sampling.hpp"

namespace compat_rand {

overridable_strategy::overridable_strategy(sample_source& parent, int32_t seed)
    : parent(&parent), seed(seed) {}

subtractive_engine& overridable_strategy::ready_engine() {
  if (!engine.initialized()) {
    engine.ensure_initialized(seed);
    logger()->debug("overridable strategy lazily initialized with seed {}", seed);
  }
  return engine;
}

double overridable_strategy::sample() {
  return ready_engine().sample();
}

int32_t overridable_strategy::next() {
  return ready_engine().internal_sample();
}

int32_t overridable_strategy::next(int32_t max_value) {
  ready_engine();
  return sampling::scale(parent->sample(), max_value);
}

int32_t overridable_strategy::next(int32_t min_value, int32_t max_value) {
  auto& prng = ready_engine();
  auto const range = sampling::int32_range(min_value, max_value);
  if (range <= sampling::max_small_range) {
    return sampling::scale(parent->sample(), range, min_value);
  } else {
    return sampling::scale_large(prng.sample_for_large_range(), range, min_value);
  }
}

uint64_t overridable_strategy::next_uint64() {
  return sampling::compose_uint64([this](int32_t bound) { return parent->next(bound); });
}

int64_t overridable_strategy::next_int64() {
  ready_engine();
  return sampling::non_negative_int64([this]() { return next_uint64(); });
}

int64_t overridable_strategy::next_int64(int64_t max_value) {
  return next_int64(0, max_value);
}

int64_t overridable_strategy::next_int64(int64_t min_value, int64_t max_value) {
  // A range of at most one value returns min_value without touching the
  // engine, so it does not trigger initialization either.
  return sampling::ranged_int64(min_value, max_value, [this]() {
    ready_engine();
    return next_uint64();
  });
}

double overridable_strategy::next_double() {
  ready_engine();
  return parent->sample();
}

float overridable_strategy::next_single() {
  ready_engine();
  return sampling::single([this]() { return parent->sample(); });
}

void overridable_strategy::next_bytes(std::vector<uint8_t>& buffer) {
  ready_engine().next_bytes(buffer.data(), buffer.size());
}

void overridable_strategy::next_bytes(uint8_t* buffer, size_t length) {
  ready_engine();
  for (size_t i = 0; i < length; i++) {
    buffer[i] = static_cast<uint8_t>(parent->next());
  }
}

} // namespace compat_rand
