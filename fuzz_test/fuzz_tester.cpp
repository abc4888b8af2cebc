#include <core/entity_id.hpp>
#include <core/uuid_parser.hpp>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

namespace {
struct fuzz_entity;
}// namespace

// Fuzzer that feeds arbitrary text to the identifier parser and checks that anything it accepts
// renders back to text that parses to the same identifier
// cppcheck-suppress unusedFunction symbolName=LLVMFuzzerTestOneInput
// NOLINTNEXTLINE(readability-identifier-naming)
extern "C" auto LLVMFuzzerTestOneInput(const uint8_t *Data, size_t Size) -> int
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const std::string_view input(reinterpret_cast<const char *>(Data), Size);

  auto parsed = domain_primitives::core::try_parse_entity_id<fuzz_entity>(input);
  if (not parsed.has_value()) { return 0; }

  const auto rendered = parsed->to_string();
  auto reparsed = domain_primitives::core::try_parse_entity_id<fuzz_entity>(rendered);
  if (not reparsed.has_value() or *reparsed != *parsed) { std::abort(); }

  return 0;
}
