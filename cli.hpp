#ifndef CLI_H
#define CLI_H

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>

#include <boost/optional.hpp>
#include <spdlog/spdlog.h>

#include "generator.hpp"

namespace compat_rand {
namespace cli {

enum struct operation {
  next,
  next_max,
  next_range,
  int64,
  int64_max,
  int64_range,
  double_value,
  single_value,
  bytes,
};

// Malformed command line or config file.
class options_error : public std::runtime_error {
 public:
  explicit options_error(const std::string& msg) : std::runtime_error(msg) {}
};

struct run_options {
  // Taken from the shared seed source when absent.
  boost::optional<int32_t> seed;
  strategy_kind strategy = strategy_kind::seeded;
  operation op = operation::next;
  int64_t min_value = 0;
  int64_t max_value = 100;
  size_t count = 10;
  spdlog::level::level_enum log_level = spdlog::level::warn;
  std::string config_file;
  bool help = false;
};

operation parse_operation(const std::string& name);
strategy_kind parse_strategy(const std::string& name);
spdlog::level::level_enum parse_log_level(const std::string& name);

// Reads the command line and then the config file it names, if any.  Values
// on the command line take precedence.  Throws options_error.
run_options parse_options(int argc, const char* const argv[]);

std::string usage();

// Writes "# seed N" followed by one value per line.  Throws options_error,
// before writing anything, if count or min/max do not suit the operation.
void run(const run_options& options, std::ostream& out);

} // namespace cli
} // namespace compat_rand

#endif //CLI_H
