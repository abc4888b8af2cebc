#include <catch2/benchmark/catch_benchmark.hpp>
#include <catch2/catch_test_macros.hpp>
#include <core/entity_id.hpp>
#include <core/uuid_parser.hpp>
#include <fmt/format.h>
#include <functional>
#include <string>

namespace domain_primitives::core::test {

struct benchmark_entity;

using benchmark_id = entity_id<benchmark_entity>;

TEST_CASE("Entity Identifier Performance Benchmarks", "[benchmark][entity_id]")
{
  SECTION("Generation")
  {
    BENCHMARK("Generate identifier") { return benchmark_id::generate(); };

    BENCHMARK("Generate raw uuid") { return uuid_generator::generate(); };
  }

  SECTION("Hashing and comparison")
  {
    const auto lhs = benchmark_id::generate();
    const auto rhs = benchmark_id::from_uuid(lhs.to_uuid());

    BENCHMARK("std::hash of identifier") { return std::hash<benchmark_id>{}(lhs); };

    BENCHMARK("Compare equal identifiers") { return lhs == rhs; };
  }

  SECTION("Text conversion")
  {
    const auto id = benchmark_id::generate();
    const std::string text = id.to_string();

    BENCHMARK("to_string") { return id.to_string(); };

    BENCHMARK("fmt::format") { return fmt::format("{}", id); };

    BENCHMARK("Parse canonical text") { return parse_entity_id<benchmark_entity>(text); };

    BENCHMARK("Reject malformed text") { return try_parse_uuid("550e8400-e29b-41d4-a716-44665544000g"); };
  }
}

}// namespace domain_primitives::core::test
