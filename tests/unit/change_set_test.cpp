#include <catch2/catch_all.hpp>

#include "quarry/document/change_set.hpp"

using quarry::change_set;

TEST_CASE("coarsest dirty path wins", "[changes]") {
  change_set c;
  c.mark("a.b");
  c.mark("a.c.d");
  REQUIRE(c.size() == 2);

  c.mark("a");
  REQUIRE(c.paths() == std::vector<std::string>{"a"});

  c.mark("a.b");
  REQUIRE(c.paths() == std::vector<std::string>{"a"});
  REQUIRE(c.covers("a.b.c"));
  REQUIRE_FALSE(c.contains("a.b"));
}

TEST_CASE("prefix matching respects segment boundaries", "[changes]") {
  change_set c;
  c.mark("a.b");
  c.mark("a.bc");
  REQUIRE(c.size() == 2);
  REQUIRE(c.covers("a.b"));
  REQUIRE(c.covers("a.b.x"));
  REQUIRE_FALSE(c.covers("a.bcd"));
  REQUIRE_FALSE(c.covers("a"));
}

TEST_CASE("marking is idempotent and clearable", "[changes]") {
  change_set c;
  REQUIRE(c.empty());
  c.mark("x");
  c.mark("x");
  REQUIRE(c.size() == 1);
  c.clear();
  REQUIRE(c.empty());
  REQUIRE(c.paths().empty());
}
