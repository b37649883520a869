#include <cstdlib>
#include <exception>
#include <iostream>

#include "argument_error.hpp"
#include "cli.hpp"
#include "logging.hpp"

int main(int argc, char* argv[]) {
  using namespace compat_rand;

  cli::run_options options;
  try {
    options = cli::parse_options(argc, argv);
  } catch (const cli::options_error& e) {
    std::cerr << "compat-rand: " << e.what() << "\n\n" << cli::usage();
    return EXIT_FAILURE;
  }
  if (options.help) {
    std::cout << cli::usage();
    return EXIT_SUCCESS;
  }

  logger()->set_level(options.log_level);
  if (!options.config_file.empty()) {
    logger()->info("read options from {}", options.config_file);
  }

  try {
    cli::run(options, std::cout);
  } catch (const cli::options_error& e) {
    std::cerr << "compat-rand: " << e.what() << '\n';
    return EXIT_FAILURE;
  } catch (const argument_error& e) {
    logger()->error("invalid argument '{}': {}", e.param_name(), e.what());
    return EXIT_FAILURE;
  } catch (const std::exception& e) {
    std::cerr << "compat-rand: " << e.what() << '\n';
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
