#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "cli.hpp"
#include "logging.hpp"
#include "shared_seed.hpp"

namespace po = boost::program_options;

namespace compat_rand {
namespace cli {

namespace {

po::options_description describe_options() {
  po::options_description desc("compat-rand options");
  desc.add_options()
      ("help,h", "produce this help message")
      ("config", po::value<std::string>(), "read options from this INI-style file")
      ("seed", po::value<int32_t>(), "32-bit seed, taken from the shared seed source if absent")
      ("strategy", po::value<std::string>()->default_value("seeded"), "seeded or overridable")
      ("operation", po::value<std::string>()->default_value("next"),
       "next, next-max, next-range, int64, int64-max, int64-range, double, single or bytes")
      ("min", po::value<int64_t>()->default_value(0), "inclusive lower bound for the range operations")
      ("max", po::value<int64_t>()->default_value(100), "exclusive upper bound for the bounded operations")
      ("count", po::value<int64_t>()->default_value(10), "number of values to print, at most 100000000")
      ("log-level", po::value<std::string>()->default_value("warn"),
       "trace, debug, info, warn, error, critical or off");
  return desc;
}

int32_t as_int32(int64_t value, const char* name) {
  if (value < std::numeric_limits<int32_t>::min() || value > std::numeric_limits<int32_t>::max()) {
    throw options_error(std::string("--") + name + " does not fit in 32 bits for this operation");
  }
  return static_cast<int32_t>(value);
}

constexpr int64_t max_count = 100000000;

size_t as_count(int64_t value) {
  if (value < 0 || value > max_count) {
    throw options_error("--count must be between 0 and " + std::to_string(max_count));
  }
  return static_cast<size_t>(value);
}

// Rejects bounds the operation cannot take, before anything is written.
void check_bounds(const run_options& options) {
  switch (options.op) {
    case operation::next_max:
      if (as_int32(options.max_value, "max") < 0) {
        throw options_error("--max must not be negative");
      }
      break;
    case operation::next_range:
      if (as_int32(options.min_value, "min") > as_int32(options.max_value, "max")) {
        throw options_error("--min must not be greater than --max");
      }
      break;
    case operation::int64_max:
      if (options.max_value < 0) {
        throw options_error("--max must not be negative");
      }
      break;
    case operation::int64_range:
      if (options.min_value > options.max_value) {
        throw options_error("--min must not be greater than --max");
      }
      break;
    default:
      break;
  }
}

} // namespace

operation parse_operation(const std::string& name) {
  if (name == "next") return operation::next;
  if (name == "next-max") return operation::next_max;
  if (name == "next-range") return operation::next_range;
  if (name == "int64") return operation::int64;
  if (name == "int64-max") return operation::int64_max;
  if (name == "int64-range") return operation::int64_range;
  if (name == "double") return operation::double_value;
  if (name == "single") return operation::single_value;
  if (name == "bytes") return operation::bytes;
  throw options_error("unknown operation '" + name + "'");
}

strategy_kind parse_strategy(const std::string& name) {
  if (name == "seeded") return strategy_kind::seeded;
  if (name == "overridable") return strategy_kind::overridable;
  throw options_error("unknown strategy '" + name + "'");
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
  // spdlog::level::from_str() maps unknown names to off.
  static const std::vector<std::string> names{"trace", "debug", "info", "warn", "error", "critical", "off"};
  for (const auto& known : names) {
    if (name == known) {
      return spdlog::level::from_str(name);
    }
  }
  throw options_error("unknown log level '" + name + "'");
}

run_options parse_options(int argc, const char* const argv[]) {
  auto const desc = describe_options();
  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);
    if (vm.count("config")) {
      // Already stored values are not overwritten, so the command line wins.
      po::store(po::parse_config_file<char>(vm["config"].as<std::string>().c_str(), desc), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    throw options_error(e.what());
  }

  run_options options;
  options.help = vm.count("help") > 0;
  if (vm.count("config")) {
    options.config_file = vm["config"].as<std::string>();
  }
  if (vm.count("seed")) {
    options.seed = vm["seed"].as<int32_t>();
  }
  options.strategy = parse_strategy(vm["strategy"].as<std::string>());
  options.op = parse_operation(vm["operation"].as<std::string>());
  options.min_value = vm["min"].as<int64_t>();
  options.max_value = vm["max"].as<int64_t>();
  options.count = as_count(vm["count"].as<int64_t>());
  options.log_level = parse_log_level(vm["log-level"].as<std::string>());
  return options;
}

std::string usage() {
  std::ostringstream out;
  out << "Usage: compat-rand [options]\n" << describe_options();
  return out.str();
}

void run(const run_options& options, std::ostream& out) {
  if (options.count > static_cast<size_t>(max_count)) {
    throw options_error("--count must be between 0 and " + std::to_string(max_count));
  }
  check_bounds(options);
  int32_t const seed = options.seed ? *options.seed : shared_seed::next();
  logger()->info("seed {}, strategy {}, {} values", seed,
                 options.strategy == strategy_kind::seeded ? "seeded" : "overridable", options.count);
  generator gen(seed, options.strategy);

  out << "# seed " << seed << '\n';
  switch (options.op) {
    case operation::bytes: {
      std::vector<uint8_t> buffer(options.count);
      gen.next_bytes(buffer);
      for (auto b : buffer) {
        out << static_cast<int>(b) << '\n';
      }
      return;
    }
    default:
      break;
  }

  for (size_t i = 0; i < options.count; i++) {
    switch (options.op) {
      case operation::next:
        out << gen.next();
        break;
      case operation::next_max:
        out << gen.next(as_int32(options.max_value, "max"));
        break;
      case operation::next_range:
        out << gen.next(as_int32(options.min_value, "min"), as_int32(options.max_value, "max"));
        break;
      case operation::int64:
        out << gen.next_int64();
        break;
      case operation::int64_max:
        out << gen.next_int64(options.max_value);
        break;
      case operation::int64_range:
        out << gen.next_int64(options.min_value, options.max_value);
        break;
      case operation::double_value:
        out << std::setprecision(17) << gen.next_double();
        break;
      case operation::single_value:
        out << std::setprecision(9) << gen.next_single();
        break;
      case operation::bytes:
        break;
    }
    out << '\n';
  }
}

} // namespace cli
} // namespace compat_rand
