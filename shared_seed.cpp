// Process-wide source of seeds for generators that are constructed without
// one.  It has an interface similar to srand() and rand().

#include <mutex>
#include <random>

#include "logging.hpp"
#include "shared_seed.hpp"

namespace compat_rand {
namespace shared_seed {

namespace {

struct source {
  std::mutex lock;
  uint32_t state;
};

source& instance() {
  static source shared{{}, [] {
    std::random_device device;
    uint32_t initial = device();
    return initial ? initial : 1;
  }()};
  return shared;
}

} // namespace

void srand(uint32_t seed) {
  auto& shared = instance();
  std::lock_guard<std::mutex> guard(shared.lock);
  shared.state = seed ? seed : 1;
}

int32_t next() {
  auto& shared = instance();
  uint32_t state;
  {
    std::lock_guard<std::mutex> guard(shared.lock);
    shared.state ^= shared.state << 13;
    shared.state ^= shared.state >> 17;
    shared.state ^= shared.state << 5;
    state = shared.state;
  }
  auto const seed = static_cast<int32_t>(state & 0x7FFFFFFF);  // Keep it positive
  logger()->debug("shared seed source produced {}", seed);
  return seed;
}

} // namespace shared_seed
} // namespace compat_rand
