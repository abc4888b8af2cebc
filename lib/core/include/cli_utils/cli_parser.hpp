#pragma once

#include <CLI/CLI.hpp>
#include <cstddef>
#include <cstdlib>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace domain_primitives::cli_utils {

/// Upper bound for `generate --count`.
inline constexpr std::size_t max_generate_count = 10000;

struct cli_args
{
  bool verbose = false;
  bool show_version = false;

  bool generate_parsed = false;
  std::size_t generate_count = 1;

  bool check_parsed = false;
  std::vector<std::string> check_inputs;
};

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void;

inline auto parse_cli_args(int argc, char **argv) -> cli_args
{
  cli_args args;
  CLI::App app{ "Typed entity identifier utility", "entity-id" };

  setup_cli_app(app, args);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    app.exit(e);
    std::exit(e.get_exit_code());// NOLINT(concurrency-mt-unsafe)
  }

  return args;
}

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void
{
  app.add_flag("-v,--verbose", args.verbose, "Enable verbose logging");
  app.add_flag("--version", args.show_version, "Show version information");

  auto *generate_cmd = app.add_subcommand("generate", "Generate random identifiers");
  generate_cmd->add_option("-n,--count", args.generate_count, "Number of identifiers to generate")
    ->check(CLI::Range(std::size_t{ 1 }, max_generate_count));
  generate_cmd->callback([&args]() { args.generate_parsed = true; });

  auto *check_cmd = app.add_subcommand("check", "Validate identifiers and print their canonical form");
  check_cmd->add_option("identifiers", args.check_inputs, "Identifier text to check")->required();
  check_cmd->callback([&args]() { args.check_parsed = true; });
}

inline auto validate_cli_args(const cli_args &args) -> bool
{
  if (args.generate_parsed) {
    if (args.generate_count == 0 or args.generate_count > max_generate_count) {
      spdlog::error("Generate count must be between 1 and {}, got {}", max_generate_count, args.generate_count);
      return false;
    }
  }

  if (args.check_parsed and args.check_inputs.empty()) {
    spdlog::error("Check command requires at least one identifier");
    return false;
  }

  return true;
}

}// namespace domain_primitives::cli_utils
