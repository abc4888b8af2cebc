#include <cli_utils/app_init.hpp>
#include <cli_utils/cli_parser.hpp>

// NOLINTNEXTLINE(bugprone-exception-escape)
auto main(int argc, char **argv) -> int
{
  auto args = domain_primitives::cli_utils::parse_cli_args(argc, argv);

  domain_primitives::cli_utils::configure_logging(args);

  if (not domain_primitives::cli_utils::validate_cli_args(args)) { return 1; }

  return domain_primitives::cli_utils::execute_cli_command(args);
}
