#include <core/uuid_parser.hpp>

#include <algorithm>
#include <array>
#include <boost/uuid/string_generator.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <utility>

namespace domain_primitives::core {

namespace {

  constexpr std::array<std::size_t, 4> hyphen_offsets = { 8, 13, 18, 23 };

  auto is_hyphen_offset(std::size_t offset) -> bool
  {
    return std::ranges::find(hyphen_offsets, offset) != hyphen_offsets.end();
  }

  auto is_hex_digit(char character) -> bool
  {
    return (character >= '0' and character <= '9') or (character >= 'a' and character <= 'f')
           or (character >= 'A' and character <= 'F');
  }

  // Returns a description of the first defect, or std::nullopt if the text is canonical.
  auto find_defect(std::string_view text) -> std::optional<std::string>
  {
    if (text.size() != canonical_uuid_length) {
      return fmt::format("expected {} characters, got {}", canonical_uuid_length, text.size());
    }

    for (std::size_t offset = 0; offset < text.size(); ++offset) {
      if (is_hyphen_offset(offset)) {
        if (text[offset] != '-') { return fmt::format("expected '-' at offset {}", offset); }
      } else if (not is_hex_digit(text[offset])) {
        return fmt::format("non-hexadecimal character at offset {}", offset);
      }
    }

    return std::nullopt;
  }

  auto decode(std::string_view text) -> boost::uuids::uuid
  {
    return boost::uuids::string_generator{}(text.begin(), text.end());
  }

}// namespace

malformed_identifier::malformed_identifier(std::string text, std::string reason)
  : std::invalid_argument(fmt::format("malformed identifier '{}': {}", text, reason)), text_(std::move(text)),
    reason_(std::move(reason))
{}

auto try_parse_uuid(std::string_view text) -> std::optional<boost::uuids::uuid>
{
  if (auto defect = find_defect(text)) {
    spdlog::debug("Rejected identifier '{}': {}", text, *defect);
    return std::nullopt;
  }
  return decode(text);
}

auto parse_uuid(std::string_view text) -> boost::uuids::uuid
{
  if (auto defect = find_defect(text)) { throw malformed_identifier(std::string{ text }, std::move(*defect)); }
  return decode(text);
}

}// namespace domain_primitives::core
