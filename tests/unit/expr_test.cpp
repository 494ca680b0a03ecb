#include <catch2/catch_all.hpp>

#include "quarry/expr.hpp"

using namespace quarry;

TEST_CASE("operator tables", "[expr]") {
  REQUIRE(parse_query_op("gte") == query_op::gte);
  REQUIRE(parse_query_op("geo_within_sphere") == query_op::geo_within_sphere);
  REQUIRE_FALSE(parse_query_op("between").has_value());
  REQUIRE(op_token(query_op::not_) == "not");
  REQUIRE(classify(query_op::near) == op_class::geo);
  REQUIRE(classify(query_op::iexact) == op_class::string);
  REQUIRE(classify(query_op::match) == op_class::custom);
  REQUIRE(is_comparison("lt"));
  REQUIRE_FALSE(is_comparison("contains"));

  REQUIRE(parse_update_op("add_to_set") == update_op::add_to_set);
  REQUIRE(canonical_name(update_op::dec) == "inc");
  REQUIRE(canonical_name(update_op::pull_all) == "pullAll");
  REQUIRE(canonical_name(update_op::add_to_set) == "addToSet");
  REQUIRE(canonical_name(update_op::set_on_insert) == "setOnInsert");
}

TEST_CASE("query keys split into path, operator and negation", "[expr]") {
  auto t = parse_query_key("age__not__gt", 5);
  REQUIRE(t.has_value());
  REQUIRE(t->path == std::vector<std::string>{"age"});
  REQUIRE(t->op == query_op::gt);
  REQUIRE(t->negate);
  REQUIRE(t->sort_key() == "age__not__gt");

  SECTION("index segments stay in the path") {
    auto idx = parse_query_key("tags__0__ne", "x");
    REQUIRE(idx.has_value());
    REQUIRE(idx->path == std::vector<std::string>{"tags", "0"});
    REQUIRE(idx->op == query_op::ne);
  }
  SECTION("a lone name is never an operator") {
    auto lone = parse_query_key("size", 3);
    REQUIRE(lone.has_value());
    REQUIRE(lone->path == std::vector<std::string>{"size"});
    REQUIRE_FALSE(lone->op.has_value());
  }
  SECTION("an index does not count as a name") {
    auto lone = parse_query_key("exists__0", 1);
    REQUIRE(lone.has_value());
    REQUIRE(lone->path == std::vector<std::string>{"exists", "0"});
    REQUIRE_FALSE(lone->op.has_value());
  }
  SECTION("malformed keys") {
    auto empty = parse_query_key("a____b", 1);
    REQUIRE_FALSE(empty.has_value());
    REQUIRE(empty.error().code == core::error_code::invalid_query);
    REQUIRE_FALSE(parse_query_key("__raw__", 1).has_value());
  }
  SECTION("raw documents") {
    auto raw = parse_query_key("__raw__", wire_value{{"$where", "1"}});
    REQUIRE(raw.has_value());
    REQUIRE(raw->raw);
    REQUIRE(raw->sort_key() == "__raw__");
  }
}

TEST_CASE("update keys split into operator, path and match", "[expr]") {
  auto t = parse_update_key("set__a__b__lt", 1);
  REQUIRE(t.has_value());
  REQUIRE(t->op == update_op::set);
  REQUIRE(t->path == std::vector<std::string>{"a", "b"});
  REQUIRE(t->match == std::optional<std::string>("lt"));

  auto bare = parse_update_key("name", "x");
  REQUIRE(bare.has_value());
  REQUIRE_FALSE(bare->op.has_value());

  auto positional = parse_update_key("set__items__S__qty", 2);
  REQUIRE(positional.has_value());
  REQUIRE(positional->path == std::vector<std::string>{"items", "S", "qty"});

  REQUIRE_FALSE(parse_update_key("set__", 1).has_value());
}
