#ifndef LOGGING_H
#define LOGGING_H

#include <memory>

#include <spdlog/spdlog.h>

namespace compat_rand {

// The library's logger, named "compat_rand".  Created on first use with a
// stderr sink at level warn unless a logger with that name was registered
// beforehand.
std::shared_ptr<spdlog::logger> logger();

} // namespace compat_rand

#endif //LOGGING_H
