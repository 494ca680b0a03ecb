#include <quarry/error.hpp>
#include <catch2/catch_all.hpp>

TEST_CASE("error codes stable subset", "[errors]") {
  using quarry::core::error_code;
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::invalid_query) == 1001u);
  REQUIRE(static_cast<unsigned>(error_code::operation_failed) == 2001u);
  REQUIRE(static_cast<unsigned>(error_code::not_unique) == 2002u);
  REQUIRE(static_cast<unsigned>(error_code::does_not_exist) == 3001u);
  REQUIRE(static_cast<unsigned>(error_code::multiple_objects) == 3002u);
  REQUIRE(static_cast<unsigned>(error_code::internal) == 9001u);
}

TEST_CASE("not_unique refines operation_failed", "[errors]") {
  using quarry::core::error_code;
  using quarry::core::is_operation_error;
  REQUIRE(is_operation_error(error_code::operation_failed));
  REQUIRE(is_operation_error(error_code::not_unique));
  REQUIRE_FALSE(is_operation_error(error_code::invalid_query));
  REQUIRE_FALSE(is_operation_error(error_code::does_not_exist));
}

TEST_CASE("fail carries code, message and component", "[errors]") {
  auto e = quarry::core::fail(quarry::core::error_code::invalid_query, "bad key", "query.parse");
  REQUIRE(e.error().code == quarry::core::error_code::invalid_query);
  REQUIRE(e.error().message == "bad key");
  REQUIRE(e.error().component == "query.parse");
}
