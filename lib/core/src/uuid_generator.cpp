#include <core/uuid_generator.hpp>

#include <boost/uuid/random_generator.hpp>

namespace domain_primitives::core {

auto uuid_generator::generate() -> boost::uuids::uuid
{
  static thread_local boost::uuids::random_generator gen;
  return gen();
}

}// namespace domain_primitives::core
