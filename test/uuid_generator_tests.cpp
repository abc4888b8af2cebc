#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_hash.hpp>
#include <catch2/catch_test_macros.hpp>
#include <core/uuid_generator.hpp>
#include <cstddef>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <vector>

TEST_CASE("uuid_generator produces version 4 uuids", "[uuid_generator]")
{
  const auto uuid = domain_primitives::core::uuid_generator::generate();

  SECTION("version nibble is 0100")
  {
    REQUIRE(uuid.version() == boost::uuids::uuid::version_random_number_based);
    constexpr std::size_t version_byte = 6;
    CHECK((uuid.data[version_byte] & 0xF0U) == 0x40U);
  }

  SECTION("variant bits are 10")
  {
    REQUIRE(uuid.variant() == boost::uuids::uuid::variant_rfc_4122);
    constexpr std::size_t variant_byte = 8;
    CHECK((uuid.data[variant_byte] & 0xC0U) == 0x80U);
  }

  SECTION("value is not nil") { REQUIRE_FALSE(uuid.is_nil()); }
}

TEST_CASE("uuid_generator values are unique", "[uuid_generator]")
{
  SECTION("consecutive calls differ")
  {
    const auto first = domain_primitives::core::uuid_generator::generate();
    const auto second = domain_primitives::core::uuid_generator::generate();
    REQUIRE(first != second);
  }

  SECTION("values generated on several threads do not collide")
  {
    constexpr std::size_t thread_count = 4;
    constexpr std::size_t per_thread = 250;

    std::mutex seen_mutex;
    std::unordered_set<boost::uuids::uuid> seen;

    std::vector<std::thread> workers;
    workers.reserve(thread_count);
    for (std::size_t t = 0; t < thread_count; ++t) {
      workers.emplace_back([&seen, &seen_mutex]() {
        std::vector<boost::uuids::uuid> local;
        local.reserve(per_thread);
        for (std::size_t i = 0; i < per_thread; ++i) {
          local.push_back(domain_primitives::core::uuid_generator::generate());
        }
        const std::scoped_lock lock(seen_mutex);
        seen.insert(local.begin(), local.end());
      });
    }
    for (auto &worker : workers) { worker.join(); }

    REQUIRE(seen.size() == thread_count * per_thread);
  }
}
