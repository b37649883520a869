#include <spdlog/sinks/stdout_color_sinks.h>

#include "logging.hpp"

namespace compat_rand {

std::shared_ptr<spdlog::logger> logger() {
  static std::shared_ptr<spdlog::logger> instance = [] {
    auto existing = spdlog::get("compat_rand");
    if (existing) {
      return existing;
    }
    auto created = spdlog::stderr_color_mt("compat_rand");
    created->set_level(spdlog::level::warn);
    return created;
  }();
  return instance;
}

} // namespace compat_rand
