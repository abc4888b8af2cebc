#pragma once

#include "internal_use_only/config.hpp"
#include <cli_utils/cli_parser.hpp>
#include <core/entity_id.hpp>
#include <core/uuid_parser.hpp>
#include <cstddef>
#include <fmt/core.h>
#include <optional>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace domain_primitives::cli_utils {

/// Kind marker for identifiers produced and checked by the command-line tool.
struct cli_entity;

using cli_entity_id = core::entity_id<cli_entity>;

/**
 * @brief Outcome of checking one identifier string.
 */
struct check_result
{
  std::string input;///< Text as given on the command line
  std::optional<std::string> canonical;///< Canonical rendering when the text parsed
  std::string error;///< Parser message when the text was malformed
};

inline auto configure_logging(const cli_args &args) -> void
{
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::cfg::load_env_levels();

  if (args.verbose) { spdlog::set_level(spdlog::level::debug); }
}

inline auto print_usage_hint() -> void
{
  fmt::print("Available commands: generate, check. Run 'entity-id --help' for details.\n");
}

[[nodiscard]] inline auto generate_identifiers(std::size_t count) -> std::vector<cli_entity_id>
{
  std::vector<cli_entity_id> ids;
  ids.reserve(count);
  for (std::size_t i = 0; i < count; ++i) { ids.push_back(cli_entity_id::generate()); }
  spdlog::debug("Generated {} identifier(s)", ids.size());
  return ids;
}

[[nodiscard]] inline auto check_identifiers(const std::vector<std::string> &inputs) -> std::vector<check_result>
{
  std::vector<check_result> results;
  results.reserve(inputs.size());
  for (const auto &input : inputs) {
    try {
      const auto id = core::parse_entity_id<cli_entity>(input);
      results.push_back(check_result{ .input = input, .canonical = id.to_string(), .error = "" });
    } catch (const core::malformed_identifier &e) {
      results.push_back(check_result{ .input = input, .canonical = std::nullopt, .error = e.what() });
    }
  }
  return results;
}

/**
 * @brief Runs the subcommand selected on the command line.
 *
 * @param args Parsed arguments
 * @return Process exit code: 0 on success, 1 if any checked identifier was malformed
 */
[[nodiscard]] inline auto execute_cli_command(const cli_args &args) -> int
{
  if (args.show_version) {
    fmt::print("entity-id v{}\n", domain_primitives::cmake::project_version);
    return 0;
  }

  if (args.generate_parsed) {
    for (const auto &id : generate_identifiers(args.generate_count)) { fmt::print("{}\n", id); }
    return 0;
  }

  if (args.check_parsed) {
    auto exit_code = 0;
    for (const auto &result : check_identifiers(args.check_inputs)) {
      if (result.canonical.has_value()) {
        fmt::print("{}\n", *result.canonical);
      } else {
        fmt::print("error: {}\n", result.error);
        exit_code = 1;
      }
    }
    return exit_code;
  }

  print_usage_hint();
  return 0;
}

}// namespace domain_primitives::cli_utils
