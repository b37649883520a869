#include <string>

#include "argument_error.hpp"
#include "generator.hpp"
#include "shared_seed.hpp"

namespace compat_rand {

namespace {

void check_non_negative(int64_t value, const char* name) {
  if (value < 0) {
    throw argument_error(name, "'" + std::string(name) + "' must be greater than or equal to zero");
  }
}

void check_ordered(int64_t min_value, int64_t max_value) {
  if (min_value > max_value) {
    throw argument_error("min_value", "'min_value' must be less than or equal to 'max_value'");
  }
}

boost::variant<seeded_strategy, overridable_strategy> make_strategy(
    sample_source& parent, int32_t seed, strategy_kind kind) {
  if (kind == strategy_kind::overridable) {
    return overridable_strategy(parent, seed);
  }
  return seeded_strategy(seed);
}

} // namespace

generator::generator()
    : impl(overridable_strategy(*this, shared_seed::next())) {}

generator::generator(int32_t seed, strategy_kind kind)
    : impl(make_strategy(*this, seed, kind)) {}

strategy_kind generator::kind() const {
  return impl.which() == 0 ? strategy_kind::seeded : strategy_kind::overridable;
}

int32_t generator::get_seed() const {
  return boost::apply_visitor([](const auto& strategy) { return strategy.get_seed(); }, impl);
}

double generator::sample() {
  return boost::apply_visitor([](auto& strategy) { return strategy.sample(); }, impl);
}

int32_t generator::next() {
  return boost::apply_visitor([](auto& strategy) { return strategy.next(); }, impl);
}

int32_t generator::next(int32_t max_value) {
  check_non_negative(max_value, "max_value");
  return boost::apply_visitor([max_value](auto& strategy) { return strategy.next(max_value); }, impl);
}

int32_t generator::next(int32_t min_value, int32_t max_value) {
  check_ordered(min_value, max_value);
  return boost::apply_visitor([min_value, max_value](auto& strategy) {
    return strategy.next(min_value, max_value);
  }, impl);
}

int64_t generator::next_int64() {
  return boost::apply_visitor([](auto& strategy) { return strategy.next_int64(); }, impl);
}

int64_t generator::next_int64(int64_t max_value) {
  check_non_negative(max_value, "max_value");
  return boost::apply_visitor([max_value](auto& strategy) { return strategy.next_int64(max_value); }, impl);
}

int64_t generator::next_int64(int64_t min_value, int64_t max_value) {
  check_ordered(min_value, max_value);
  return boost::apply_visitor([min_value, max_value](auto& strategy) {
    return strategy.next_int64(min_value, max_value);
  }, impl);
}

double generator::next_double() {
  return boost::apply_visitor([](auto& strategy) { return strategy.next_double(); }, impl);
}

float generator::next_single() {
  return boost::apply_visitor([](auto& strategy) { return strategy.next_single(); }, impl);
}

void generator::next_bytes(std::vector<uint8_t>& buffer) {
  boost::apply_visitor([&buffer](auto& strategy) { strategy.next_bytes(buffer); }, impl);
}

void generator::next_bytes(uint8_t* buffer, size_t length) {
  if (buffer == nullptr && length != 0) {
    throw argument_error("buffer", "'buffer' must not be null");
  }
  boost::apply_visitor([buffer, length](auto& strategy) { strategy.next_bytes(buffer, length); }, impl);
}

} // namespace compat_rand
