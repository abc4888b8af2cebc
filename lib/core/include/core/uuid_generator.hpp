#pragma once

#include <boost/uuid/uuid.hpp>

namespace domain_primitives::core {

/**
 * @brief Source of RFC 4122 version 4 UUIDs.
 *
 * Each thread owns its own random generator, so concurrent callers never contend.
 */
class uuid_generator
{
public:
  /**
   * @brief Generates a new random UUID.
   *
   * @return Version 4 UUID with the RFC 4122 variant bits set
   * @throws boost::uuids::entropy_error if the operating system random source fails
   */
  [[nodiscard]] static auto generate() -> boost::uuids::uuid;
};

}// namespace domain_primitives::core
