#define BOOST_TEST_MODULE cli tests
#include <boost/test/unit_test.hpp>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include "cli.hpp"

using namespace compat_rand;
using namespace compat_rand::cli;

BOOST_AUTO_TEST_SUITE(cli_tests)

template <size_t N>
static run_options parse(const char* const (&argv)[N]) {
  return parse_options(N, argv);
}

static std::string run_to_string(const run_options& options) {
  std::ostringstream out;
  run(options, out);
  return out.str();
}

BOOST_AUTO_TEST_CASE(defaults) {
  const char* const argv[] = {"compat-rand"};
  auto const options = parse(argv);
  BOOST_CHECK(!options.seed);
  BOOST_CHECK(options.strategy == strategy_kind::seeded);
  BOOST_CHECK(options.op == operation::next);
  BOOST_CHECK_EQUAL(options.min_value, 0);
  BOOST_CHECK_EQUAL(options.max_value, 100);
  BOOST_CHECK_EQUAL(options.count, 10u);
  BOOST_CHECK(options.log_level == spdlog::level::warn);
  BOOST_CHECK(!options.help);
}

BOOST_AUTO_TEST_CASE(command_line_values) {
  const char* const argv[] = {"compat-rand", "--seed", "42", "--strategy", "overridable",
                              "--operation", "int64-range", "--min=-5", "--max", "5",
                              "--count", "3", "--log-level", "debug"};
  auto const options = parse(argv);
  BOOST_REQUIRE(options.seed);
  BOOST_CHECK_EQUAL(*options.seed, 42);
  BOOST_CHECK(options.strategy == strategy_kind::overridable);
  BOOST_CHECK(options.op == operation::int64_range);
  BOOST_CHECK_EQUAL(options.min_value, -5);
  BOOST_CHECK_EQUAL(options.max_value, 5);
  BOOST_CHECK_EQUAL(options.count, 3u);
  BOOST_CHECK(options.log_level == spdlog::level::debug);
}

BOOST_AUTO_TEST_CASE(bad_values_are_rejected) {
  const char* const bad_operation[] = {"compat-rand", "--operation", "shuffle"};
  BOOST_CHECK_THROW(parse(bad_operation), options_error);
  const char* const bad_strategy[] = {"compat-rand", "--strategy", "xoshiro"};
  BOOST_CHECK_THROW(parse(bad_strategy), options_error);
  const char* const bad_seed[] = {"compat-rand", "--seed", "forty-two"};
  BOOST_CHECK_THROW(parse(bad_seed), options_error);
  const char* const bad_level[] = {"compat-rand", "--log-level", "loud"};
  BOOST_CHECK_THROW(parse(bad_level), options_error);
  const char* const unknown[] = {"compat-rand", "--colour"};
  BOOST_CHECK_THROW(parse(unknown), options_error);
  const char* const missing_config[] = {"compat-rand", "--config", "does/not/exist.ini"};
  BOOST_CHECK_THROW(parse(missing_config), options_error);
}

BOOST_AUTO_TEST_CASE(config_file_with_command_line_override) {
  const char* const path = "cli_tests_config.ini";
  {
    std::ofstream config(path);
    config << "seed=42\n"
           << "operation=next-max\n"
           << "max=100\n"
           << "count=5\n";
  }
  const char* const argv[] = {"compat-rand", "--config", path, "--count", "3"};
  auto const options = parse(argv);
  std::remove(path);
  BOOST_REQUIRE(options.seed);
  BOOST_CHECK_EQUAL(*options.seed, 42);
  BOOST_CHECK(options.op == operation::next_max);
  BOOST_CHECK_EQUAL(options.count, 3u);
  BOOST_CHECK_EQUAL(options.config_file, path);
}

BOOST_AUTO_TEST_CASE(run_prints_seed_and_values) {
  run_options options;
  options.seed = 42;
  options.op = operation::next_max;
  options.max_value = 100;
  options.count = 3;
  BOOST_CHECK_EQUAL(run_to_string(options), "# seed 42\n66\n14\n12\n");

  options.op = operation::next;
  options.count = 2;
  options.strategy = strategy_kind::overridable;
  BOOST_CHECK_EQUAL(run_to_string(options), "# seed 42\n1434747710\n302596119\n");

  options.op = operation::bytes;
  options.count = 4;
  BOOST_CHECK_EQUAL(run_to_string(options), "# seed 42\n62\n23\n186\n150\n");

  options.op = operation::int64_range;
  options.min_value = -1000;
  options.max_value = 1000;
  options.count = 2;
  BOOST_CHECK_EQUAL(run_to_string(options), "# seed 42\n-743\n-463\n");
}

BOOST_AUTO_TEST_CASE(run_rejects_out_of_range_bounds) {
  run_options options;
  options.seed = 1;
  options.op = operation::next_range;
  options.max_value = 1LL << 40;
  BOOST_CHECK_THROW(run_to_string(options), options_error);

  options.op = operation::next_range;
  options.min_value = 5;
  options.max_value = 4;
  BOOST_CHECK_THROW(run_to_string(options), options_error);
}

// Nothing, not even the seed line, is written when the bounds are rejected.
BOOST_AUTO_TEST_CASE(bounds_checked_before_output) {
  run_options options;
  options.seed = 1;
  options.op = operation::int64_max;
  options.max_value = -3;
  std::ostringstream out;
  BOOST_CHECK_THROW(run(options, out), options_error);
  BOOST_CHECK_EQUAL(out.str(), "");

  options.op = operation::int64_range;
  options.min_value = 10;
  options.max_value = -10;
  BOOST_CHECK_THROW(run(options, out), options_error);
  BOOST_CHECK_EQUAL(out.str(), "");
}

// next-max draws on max alone, so an unused min of any size is fine.
BOOST_AUTO_TEST_CASE(next_max_ignores_min) {
  run_options options;
  options.seed = 42;
  options.op = operation::next_max;
  options.min_value = 99999999999LL;
  options.max_value = 100;
  options.count = 2;
  BOOST_CHECK_EQUAL(run_to_string(options), "# seed 42\n66\n14\n");

  options.max_value = -1;
  BOOST_CHECK_THROW(run_to_string(options), options_error);
}

BOOST_AUTO_TEST_CASE(negative_or_huge_count_is_rejected) {
  const char* const negative[] = {"compat-rand", "--seed", "1", "--operation", "bytes", "--count", "-1"};
  BOOST_CHECK_THROW(parse(negative), options_error);
  const char* const negative_inline[] = {"compat-rand", "--count=-1"};
  BOOST_CHECK_THROW(parse(negative_inline), options_error);
  const char* const huge[] = {"compat-rand", "--count", "100000001"};
  BOOST_CHECK_THROW(parse(huge), options_error);
  const char* const largest[] = {"compat-rand", "--count", "100000000"};
  BOOST_CHECK_EQUAL(parse(largest).count, 100000000u);

  run_options options;
  options.seed = 1;
  options.op = operation::bytes;
  options.count = static_cast<size_t>(-1);
  std::ostringstream out;
  BOOST_CHECK_THROW(run(options, out), options_error);
  BOOST_CHECK_EQUAL(out.str(), "");
}

BOOST_AUTO_TEST_SUITE_END()
