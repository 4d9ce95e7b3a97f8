#include <iostream>
#include <string>
#include <vector>

#include "cli_commands.hpp"

#ifndef ENVX_VERSION
#define ENVX_VERSION "0.0.0"
#endif

int main(int argc, char* argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);

  envx::cli::Options options;
  envx::cli::CommandResult parsed = envx::cli::parse_arguments(args, options);
  if (parsed.exit_code != 0) {
    std::cerr << parsed.message << std::endl;
    return parsed.exit_code;
  }

  if (options.show_help) {
    std::cout << envx::cli::usage();
    return 0;
  }
  if (options.show_version) {
    std::cout << "envx v" << ENVX_VERSION << std::endl;
    return 0;
  }
  if (options.inputs.empty()) {
    std::cerr << envx::cli::usage();
    return 1;
  }

  envx::EnvMap env;
  if (!options.empty_env) env = envx::cli::process_environment();

  envx::cli::CommandResult result = envx::cli::run(options, env, std::cout, std::cerr);
  return result.exit_code;
}
