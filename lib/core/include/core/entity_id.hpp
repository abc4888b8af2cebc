#pragma once

#include <core/uuid_generator.hpp>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_hash.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cstddef>
#include <fmt/format.h>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace domain_primitives::core {

/**
 * @brief Unique identifier of an entity of kind @p Kind.
 *
 * Wraps a 128-bit UUID. The kind is a compile-time tag only: it takes no storage and never
 * takes part in comparison, hashing or rendering, but identifiers of different kinds are
 * distinct types and cannot be compared or assigned to one another.
 *
 * @code
 * struct order;
 * using order_id = entity_id<order>;
 *
 * const auto first = order_id::generate();
 * const auto second = order_id::from_uuid(first.to_uuid());
 * // first == second
 * @endcode
 *
 * @tparam Kind Marker type naming the entity kind; may be incomplete
 */
template<typename Kind> class entity_id
{
public:
  using kind_type = Kind;

  /**
   * @brief Creates an identifier from a fresh random version 4 UUID.
   *
   * @return New identifier
   * @throws boost::uuids::entropy_error if the operating system random source fails
   */
  [[nodiscard]] static auto generate() -> entity_id { return entity_id{ uuid_generator::generate() }; }

  /**
   * @brief Wraps an existing UUID.
   *
   * Version and variant bits are not checked; any 128-bit value is accepted.
   *
   * @param uuid Raw value, e.g. read back from storage or a wire message
   * @return Identifier holding @p uuid unchanged
   */
  [[nodiscard]] static constexpr auto from_uuid(const boost::uuids::uuid &uuid) noexcept -> entity_id
  {
    return entity_id{ uuid };
  }

  /**
   * @brief Returns the underlying UUID.
   */
  [[nodiscard]] constexpr auto to_uuid() const noexcept -> boost::uuids::uuid { return uuid_; }

  /**
   * @brief Renders the identifier in canonical form.
   *
   * @return Lowercase hyphenated hex (e.g., "550e8400-e29b-41d4-a716-446655440000")
   */
  [[nodiscard]] auto to_string() const -> std::string { return boost::uuids::to_string(uuid_); }

  [[nodiscard]] friend auto operator==(const entity_id &lhs, const entity_id &rhs) noexcept -> bool
  {
    return lhs.uuid_ == rhs.uuid_;
  }

  [[nodiscard]] friend auto operator!=(const entity_id &lhs, const entity_id &rhs) noexcept -> bool
  {
    return not(lhs == rhs);
  }

  friend auto operator<<(std::ostream &out, const entity_id &id) -> std::ostream & { return out << id.to_string(); }

  /// boost::hash support; identical to hashing the raw UUID.
  [[nodiscard]] friend auto hash_value(const entity_id &id) noexcept -> std::size_t
  {
    return boost::uuids::hash_value(id.uuid_);
  }

private:
  explicit constexpr entity_id(const boost::uuids::uuid &uuid) noexcept : uuid_(uuid) {}

  boost::uuids::uuid uuid_;
};

}// namespace domain_primitives::core

template<typename Kind> struct std::hash<domain_primitives::core::entity_id<Kind>>
{
  auto operator()(const domain_primitives::core::entity_id<Kind> &id) const noexcept -> std::size_t
  {
    return std::hash<boost::uuids::uuid>{}(id.to_uuid());
  }
};

template<typename Kind> struct fmt::formatter<domain_primitives::core::entity_id<Kind>> : fmt::formatter<std::string_view>
{
  auto format(const domain_primitives::core::entity_id<Kind> &id, fmt::format_context &ctx) const
  {
    return fmt::formatter<std::string_view>::format(id.to_string(), ctx);
  }
};
