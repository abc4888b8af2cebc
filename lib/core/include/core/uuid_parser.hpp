#pragma once

#include <core/entity_id.hpp>

#include <boost/uuid/uuid.hpp>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace domain_primitives::core {

/// Length of the canonical 8-4-4-4-12 text form.
inline constexpr std::size_t canonical_uuid_length = 36;

/**
 * @brief Raised when text is not a canonical hyphenated UUID.
 */
class malformed_identifier : public std::invalid_argument
{
public:
  /**
   * @param text Offending input, kept verbatim
   * @param reason Short description of the first defect found
   */
  malformed_identifier(std::string text, std::string reason);

  /// Input that failed to parse.
  [[nodiscard]] auto text() const noexcept -> const std::string & { return text_; }

  /// First defect found in the input.
  [[nodiscard]] auto reason() const noexcept -> const std::string & { return reason_; }

private:
  std::string text_;
  std::string reason_;
};

/**
 * @brief Parses a UUID in canonical hyphenated form.
 *
 * Hex digits may be in either case. Braces, "urn:uuid:" prefixes, surrounding whitespace and
 * the unhyphenated 32-digit form are rejected. Version and variant bits are not checked.
 *
 * @param text Candidate text (e.g., "550e8400-e29b-41d4-a716-446655440000")
 * @return Parsed UUID or std::nullopt if the text is malformed
 */
[[nodiscard]] auto try_parse_uuid(std::string_view text) -> std::optional<boost::uuids::uuid>;

/**
 * @brief Parses a UUID in canonical hyphenated form.
 *
 * @param text Candidate text
 * @return Parsed UUID
 * @throws malformed_identifier if the text is malformed
 */
[[nodiscard]] auto parse_uuid(std::string_view text) -> boost::uuids::uuid;

/**
 * @brief Parses text into an identifier of kind @p Kind.
 *
 * @throws malformed_identifier if the text is malformed
 */
template<typename Kind> [[nodiscard]] auto parse_entity_id(std::string_view text) -> entity_id<Kind>
{
  return entity_id<Kind>::from_uuid(parse_uuid(text));
}

/**
 * @brief Parses text into an identifier of kind @p Kind.
 *
 * @return Identifier or std::nullopt if the text is malformed
 */
template<typename Kind> [[nodiscard]] auto try_parse_entity_id(std::string_view text) -> std::optional<entity_id<Kind>>
{
  if (auto uuid = try_parse_uuid(text)) { return entity_id<Kind>::from_uuid(*uuid); }
  return std::nullopt;
}

}// namespace domain_primitives::core
