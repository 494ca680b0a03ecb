#include <catch2/catch_all.hpp>

#include "quarry/storage/matcher.hpp"
#include "support/fixtures.hpp"

using namespace quarry;
using quarry::storage::apply_update;
using quarry::storage::matches;
using quarry::test::unordered;
using quarry::test::wire;

namespace {

auto match(const char* query, const wire_value& doc) -> bool {
  auto r = matches(wire(query), doc);
  REQUIRE(r.has_value());
  return *r;
}

} // namespace

TEST_CASE("equality, dotted paths and array containment", "[matcher]") {
  const auto doc = wire(R"({"_id": 1, "name": "Ross", "tags": ["a", "b"],
                           "addr": {"city": "Oslo"}, "items": [{"qty": 1}, {"qty": 5}]})");
  REQUIRE(match(R"({"name": "Ross"})", doc));
  REQUIRE_FALSE(match(R"({"name": "Bob"})", doc));
  REQUIRE(match(R"({"tags": "a"})", doc));
  REQUIRE(match(R"({"tags.1": "b"})", doc));
  REQUIRE(match(R"({"addr.city": "Oslo"})", doc));
  REQUIRE(match(R"({"items.qty": 5})", doc));
  REQUIRE(match(R"({"missing": null})", doc));
  REQUIRE(match(R"({})", doc));
}

TEST_CASE("comparison and set operators", "[matcher]") {
  const auto doc = wire(R"({"age": 30, "tags": ["a", "b"], "name": "Ross"})");
  REQUIRE(match(R"({"age": {"$gt": 18, "$lt": 40}})", doc));
  REQUIRE_FALSE(match(R"({"age": {"$gte": 31}})", doc));
  REQUIRE(match(R"({"age": {"$ne": 3}})", doc));
  REQUIRE(match(R"({"age": {"$in": [1, 30]}})", doc));
  REQUIRE(match(R"({"age": {"$nin": [1, 2]}})", doc));
  REQUIRE(match(R"({"tags": {"$all": ["b", "a"]}})", doc));
  REQUIRE(match(R"({"tags": {"$size": 2}})", doc));
  REQUIRE(match(R"({"age": {"$exists": true}, "x": {"$exists": false}})", doc));
  REQUIRE(match(R"({"age": {"$mod": [7, 2]}})", doc));
  REQUIRE(match(R"({"age": {"$not": {"$gt": 40}}})", doc));
  REQUIRE_FALSE(match(R"({"name": {"$gt": 1}})", doc));
}

TEST_CASE("regex and logical operators", "[matcher]") {
  const auto doc = wire(R"({"name": "Ross Geller", "age": 30})");
  REQUIRE(match(R"({"name": {"$regex": "^Ross"}})", doc));
  REQUIRE_FALSE(match(R"({"name": {"$regex": "^ross"}})", doc));
  REQUIRE(match(R"({"name": {"$regex": "^ross", "$options": "i"}})", doc));
  REQUIRE(match(R"({"name": {"$not": {"$regex": "Bing"}}})", doc));
  REQUIRE(match(R"({"$and": [{"age": 30}, {"name": {"$regex": "Geller$"}}]})", doc));
  REQUIRE(match(R"({"$or": [{"age": 1}, {"age": 30}]})", doc));
  REQUIRE_FALSE(match(R"({"$nor": [{"age": 30}]})", doc));

  auto bad = matches(wire(R"({"name": {"$regex": "("}})"), doc);
  REQUIRE_FALSE(bad.has_value());
}

TEST_CASE("elemMatch", "[matcher]") {
  const auto doc = wire(R"({"items": [{"qty": 1, "sku": "a"}, {"qty": 5, "sku": "b"}], "nums": [1, 9]})");
  REQUIRE(match(R"({"items": {"$elemMatch": {"qty": 5, "sku": "b"}}})", doc));
  REQUIRE_FALSE(match(R"({"items": {"$elemMatch": {"qty": 5, "sku": "a"}}})", doc));
  REQUIRE(match(R"({"nums": {"$elemMatch": {"$gt": 5}}})", doc));
}

TEST_CASE("unsupported operators are reported", "[matcher]") {
  const auto doc = wire(R"({"loc": [1, 2]})");
  auto geo = matches(wire(R"({"loc": {"$near": [1, 2]}})"), doc);
  REQUIRE_FALSE(geo.has_value());
  REQUIRE(geo.error().code == core::error_code::unsupported);

  auto where = matches(wire(R"({"$where": "1"})"), doc);
  REQUIRE_FALSE(where.has_value());
  REQUIRE(where.error().code == core::error_code::unsupported);
}

TEST_CASE("update operators", "[matcher][update]") {
  auto doc = wire(R"({"_id": 1, "n": 1, "tags": ["a", "b", "a"], "items": [{"sku": "x", "qty": 1}]})");
  const auto filter = wire(R"({"items.sku": "x"})");

  REQUIRE(apply_update(doc, wire(R"({"$set": {"name": "R", "addr.city": "Oslo"}, "$inc": {"n": 2}})"), filter, false)
              .has_value());
  REQUIRE(doc["name"] == "R");
  REQUIRE(doc["addr"]["city"] == "Oslo");
  REQUIRE(doc["n"] == 3);

  REQUIRE(apply_update(doc, wire(R"({"$pull": {"tags": "a"}})"), filter, false).has_value());
  REQUIRE(unordered(doc["tags"]) == unordered(wire(R"(["b"])")));

  REQUIRE(apply_update(doc, wire(R"({"$addToSet": {"tags": {"$each": ["b", "c"]}}})"), filter, false).has_value());
  REQUIRE(unordered(doc["tags"]) == unordered(wire(R"(["b", "c"])")));

  REQUIRE(apply_update(doc, wire(R"({"$push": {"tags": "d"}, "$pop": {"tags": -1}})"), filter, false).has_value());
  REQUIRE(unordered(doc["tags"]) == unordered(wire(R"(["c", "d"])")));

  REQUIRE(apply_update(doc, wire(R"({"$pullAll": {"tags": ["c", "d"]}})"), filter, false).has_value());
  REQUIRE(doc["tags"].empty());

  REQUIRE(apply_update(doc, wire(R"({"$set": {"items.$.qty": 9}})"), filter, false).has_value());
  REQUIRE(doc["items"][0]["qty"] == 9);

  REQUIRE(apply_update(doc, wire(R"({"$unset": {"name": 1}})"), filter, false).has_value());
  REQUIRE_FALSE(doc.contains("name"));

  REQUIRE(apply_update(doc, wire(R"({"$setOnInsert": {"created": true}})"), filter, false).has_value());
  REQUIRE_FALSE(doc.contains("created"));

  auto id_change = apply_update(doc, wire(R"({"$set": {"_id": 2}})"), filter, false);
  REQUIRE_FALSE(id_change.has_value());
  REQUIRE(id_change.error().code == core::error_code::operation_failed);

  auto no_match = apply_update(doc, wire(R"({"$set": {"items.$.qty": 1}})"), wire("{}"), false);
  REQUIRE_FALSE(no_match.has_value());
}

TEST_CASE("pull with a condition document", "[matcher][update]") {
  auto doc = wire(R"({"addresses": [{"city": "Oslo"}, {"city": "Rome"}], "n": [1, 5, 9]})");
  REQUIRE(apply_update(doc, wire(R"({"$pull": {"addresses": {"city": "Oslo"}, "n": {"$gt": 4}}})"), wire("{}"),
                       false)
              .has_value());
  REQUIRE(unordered(doc) == unordered(wire(R"({"addresses": [{"city": "Rome"}], "n": [1]})")));
}

TEST_CASE("array indices in update paths are bounded", "[matcher][update]") {
  auto doc = wire(R"({"tags": ["a"]})");
  const auto none = wire("{}");

  auto unparsable = apply_update(doc, wire(R"({"$set": {"tags.99999999999999999999": "x"}})"), none, false);
  REQUIRE_FALSE(unparsable.has_value());
  REQUIRE(unparsable.error().code == core::error_code::operation_failed);

  auto far = apply_update(doc, wire(R"({"$set": {"tags.1000000000": "x"}})"), none, false);
  REQUIRE_FALSE(far.has_value());
  REQUIRE(far.error().code == core::error_code::operation_failed);
  REQUIRE(doc["tags"].size() == 1);

  auto nested = apply_update(doc, wire(R"({"$set": {"tags.99999999999999999999.x": 1}})"), none, false);
  REQUIRE_FALSE(nested.has_value());

  REQUIRE(apply_update(doc, wire(R"({"$set": {"tags.3": "d"}})"), none, false).has_value());
  REQUIRE(doc["tags"] == wire(R"(["a", null, null, "d"])"));

  REQUIRE(apply_update(doc, wire(R"({"$unset": {"tags.99999999999999999999": 1}})"), none, false).has_value());
  REQUIRE(apply_update(doc, wire(R"({"$pull": {"tags.99999999999999999999": "a"}})"), none, false).has_value());
  REQUIRE(doc["tags"].size() == 4);

  REQUIRE_FALSE(match(R"({"tags.99999999999999999999": "a"})", doc));
}

TEST_CASE("integer arithmetic stays in range", "[matcher][update]") {
  auto doc = wire(R"({"big": 9223372036854775807, "small": -9223372036854775808})");
  const auto none = wire("{}");

  auto up = apply_update(doc, wire(R"({"$inc": {"big": 1}})"), none, false);
  REQUIRE_FALSE(up.has_value());
  REQUIRE(up.error().code == core::error_code::operation_failed);
  auto down = apply_update(doc, wire(R"({"$inc": {"small": -1}})"), none, false);
  REQUIRE_FALSE(down.has_value());
  REQUIRE(doc["big"] == wire("9223372036854775807"));

  REQUIRE(apply_update(doc, wire(R"({"$inc": {"big": -7}})"), none, false).has_value());
  REQUIRE(doc["big"] == wire("9223372036854775800"));

  REQUIRE(match(R"({"small": {"$mod": [-1, 0]}})", doc));
  REQUIRE(match(R"({"big": {"$mod": [10, 0]}})", doc));
  auto huge_divisor = matches(wire(R"({"big": {"$mod": [1e300, 0]}})"), doc);
  REQUIRE_FALSE(huge_divisor.has_value());
  REQUIRE_FALSE(match(R"({"big": {"$mod": [2, 0], "$exists": true}, "small": {"$size": 1}})", doc));
}
