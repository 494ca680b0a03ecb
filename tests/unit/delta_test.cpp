#include <catch2/catch_all.hpp>

#include "quarry/document/document.hpp"
#include "quarry/queryset/query_set.hpp"
#include "quarry/storage/memory_backend.hpp"
#include "support/fixtures.hpp"

using namespace quarry;
using quarry::test::models;
using quarry::test::unordered;
using quarry::test::wire;

namespace {

using paths = std::vector<std::string>;

auto saved_and_loaded(storage::memory_database& db, const schema& s) -> document {
  document fresh(s);
  REQUIRE(fresh.save(db).has_value());
  auto first = query_set(db, s).first();
  REQUIRE(first.has_value());
  REQUIRE(first->has_value());
  return std::move(**first);
}

auto embedded_sample() -> embedded_document {
  embedded_document e(*models().embedded);
  REQUIRE(e.set("string_field", "hello").has_value());
  REQUIRE(e.set("int_field", 1).has_value());
  REQUIRE(e.set("dict_field", value::map{{"hello", value("world")}}).has_value());
  REQUIRE(e.set("list_field", value::list{value("1"), value(2), value(value::map{{"hello", value("world")}})})
              .has_value());
  return e;
}

void save_and_reload(storage::memory_database& db, document& doc) {
  REQUIRE(doc.save(db).has_value());
  REQUIRE(doc.reload(db).has_value());
  REQUIRE(doc.changed_paths().empty());
}

} // namespace

TEST_CASE("delta of top-level fields", "[delta]") {
  storage::memory_database db;
  auto doc = saved_and_loaded(db, *models().doc);
  REQUIRE(doc.state() == document_state::clean);
  REQUIRE(doc.changed_paths().empty());
  REQUIRE(doc.delta().empty());

  REQUIRE(doc.set("string_field", "hello").has_value());
  REQUIRE(doc.state() == document_state::dirty);
  REQUIRE(doc.changed_paths() == paths{"string_field"});
  REQUIRE(unordered(doc.delta().sets) == unordered(wire(R"({"string_field": "hello"})")));
  REQUIRE(doc.delta().unsets.empty());

  doc.clear_changed_fields();
  REQUIRE(doc.set("int_field", 1).has_value());
  REQUIRE(doc.changed_paths() == paths{"int_field"});
  REQUIRE(unordered(doc.delta().sets) == unordered(wire(R"({"int_field": 1})")));

  doc.clear_changed_fields();
  REQUIRE(doc.set("dict_field", value::map{{"hello", value("world")}, {"ping", value("pong")}}).has_value());
  REQUIRE(doc.changed_paths() == paths{"dict_field"});
  REQUIRE(unordered(doc.delta().sets) == unordered(wire(R"({"dict_field": {"hello": "world", "ping": "pong"}})")));

  doc.clear_changed_fields();
  REQUIRE(doc.set("list_field", value::list{value("1"), value(2), value(value::map{{"hello", value("world")}})})
              .has_value());
  REQUIRE(doc.changed_paths() == paths{"list_field"});
  REQUIRE(unordered(doc.delta().sets) == unordered(wire(R"({"list_field": ["1", 2, {"hello": "world"}]})")));

  SECTION("empty containers become unsets") {
    doc.clear_changed_fields();
    REQUIRE(doc.set("dict_field", value::map{}).has_value());
    REQUIRE(doc.changed_paths() == paths{"dict_field"});
    REQUIRE(doc.delta().sets.empty());
    REQUIRE(unordered(doc.delta().unsets) == unordered(wire(R"({"dict_field": 1})")));

    doc.clear_changed_fields();
    REQUIRE(doc.set("list_field", value::list{}).has_value());
    REQUIRE(doc.changed_paths() == paths{"list_field"});
    REQUIRE(unordered(doc.delta().unsets) == unordered(wire(R"({"list_field": 1})")));
  }
  SECTION("null becomes an unset") {
    doc.clear_changed_fields();
    REQUIRE(doc.set("string_field", nullptr).has_value());
    REQUIRE(unordered(doc.delta().unsets) == unordered(wire(R"({"string_field": 1})")));
  }
}

TEST_CASE("delta through embedded documents", "[delta]") {
  storage::memory_database db;
  auto doc = saved_and_loaded(db, *models().doc);

  REQUIRE(doc.set("embedded_field", embedded_sample()).has_value());
  REQUIRE(doc.changed_paths() == paths{"embedded_field"});

  auto* inner = doc.embedded("embedded_field");
  REQUIRE(inner != nullptr);
  REQUIRE(inner->parent() == &doc);
  REQUIRE(unordered(inner->delta().sets) ==
          unordered(wire(R"({"string_field": "hello", "int_field": 1, "dict_field": {"hello": "world"},
                             "list_field": ["1", 2, {"hello": "world"}]})")));
  REQUIRE(unordered(doc.delta().sets) ==
          unordered(wire(R"({"embedded_field": {"_cls": "Embedded", "string_field": "hello", "int_field": 1,
                             "dict_field": {"hello": "world"}, "list_field": ["1", 2, {"hello": "world"}]}})")));
  save_and_reload(db, doc);

  SECTION("emptying an embedded field unsets its full path") {
    REQUIRE(doc.set("embedded_field.dict_field", value::map{}).has_value());
    REQUIRE(doc.changed_paths() == paths{"embedded_field.dict_field"});
    REQUIRE(unordered(doc.embedded("embedded_field")->delta().unsets) == unordered(wire(R"({"dict_field": 1})")));
    REQUIRE(unordered(doc.delta().unsets) == unordered(wire(R"({"embedded_field.dict_field": 1})")));
    REQUIRE(doc.delta().sets.empty());
    save_and_reload(db, doc);
    const auto* dict = doc.get("embedded_field.dict_field");
    REQUIRE(dict != nullptr);
    REQUIRE(dict->as_map()->empty());
  }

  SECTION("documents nested in lists track their own paths") {
    auto second = embedded_sample();
    REQUIRE(doc.set("embedded_field.list_field", value::list{value("1"), value(2), value(std::move(second))})
                .has_value());
    REQUIRE(doc.changed_paths() == paths{"embedded_field.list_field"});
    REQUIRE(unordered(doc.delta().sets) ==
            unordered(wire(R"({"embedded_field.list_field": ["1", 2, {"_cls": "Embedded", "string_field": "hello",
                               "int_field": 1, "dict_field": {"hello": "world"},
                               "list_field": ["1", 2, {"hello": "world"}]}]})")));
    save_and_reload(db, doc);
    REQUIRE(doc.embedded("embedded_field.list_field.2") != nullptr);

    REQUIRE(doc.set("embedded_field.list_field.2.string_field", "world").has_value());
    REQUIRE(doc.changed_paths() == paths{"embedded_field.list_field.2.string_field"});
    REQUIRE(unordered(doc.embedded("embedded_field")->delta().sets) ==
            unordered(wire(R"({"list_field.2.string_field": "world"})")));
    REQUIRE(unordered(doc.delta().sets) == unordered(wire(R"({"embedded_field.list_field.2.string_field": "world"})")));
    save_and_reload(db, doc);
    REQUIRE(*doc.get("embedded_field.list_field.2.string_field")->as_string() == "world");

    // Assigning the element itself supersedes the finer path.
    REQUIRE(doc.set("embedded_field.list_field.2.string_field", "hello world").has_value());
    value element = *doc.get("embedded_field.list_field.2");
    REQUIRE(doc.set("embedded_field.list_field.2", std::move(element)).has_value());
    REQUIRE(doc.changed_paths() == paths{"embedded_field.list_field.2"});
    REQUIRE(unordered(doc.delta().sets) ==
            unordered(wire(R"({"embedded_field.list_field.2": {"_cls": "Embedded", "string_field": "hello world",
                               "int_field": 1, "dict_field": {"hello": "world"},
                               "list_field": ["1", 2, {"hello": "world"}]}})")));
    save_and_reload(db, doc);
    REQUIRE(*doc.get("embedded_field.list_field.2.string_field")->as_string() == "hello world");

    auto popped = doc.pop("embedded_field.list_field.2.list_field", 0);
    REQUIRE(popped.has_value());
    REQUIRE(*popped->as_string() == "1");
    REQUIRE(unordered(doc.delta().sets) ==
            unordered(wire(R"({"embedded_field.list_field.2.list_field": [2, {"hello": "world"}]})")));
    save_and_reload(db, doc);

    REQUIRE(doc.append("embedded_field.list_field.2.list_field", 1).has_value());
    REQUIRE(unordered(doc.delta().sets) ==
            unordered(wire(R"({"embedded_field.list_field.2.list_field": [2, {"hello": "world"}, 1]})")));
    save_and_reload(db, doc);
    REQUIRE(doc.get("embedded_field.list_field.2.list_field")->as_list()->size() == 3);

    REQUIRE(doc.unset("embedded_field.list_field.2.list_field.1.hello").has_value());
    REQUIRE(doc.changed_paths() == paths{"embedded_field.list_field.2.list_field.1.hello"});
    REQUIRE(unordered(doc.delta().unsets) ==
            unordered(wire(R"({"embedded_field.list_field.2.list_field.1.hello": 1})")));
    save_and_reload(db, doc);

    REQUIRE(doc.unset("embedded_field.list_field.2.list_field").has_value());
    REQUIRE(unordered(doc.delta().unsets) == unordered(wire(R"({"embedded_field.list_field.2.list_field": 1})")));
    REQUIRE(doc.delta().sets.empty());
  }

  SECTION("documents nested in dicts") {
    REQUIRE(doc.set("dict_field.Embedded", embedded_sample()).has_value());
    REQUIRE(doc.changed_paths() == paths{"dict_field.Embedded"});
    save_and_reload(db, doc);
    REQUIRE(doc.embedded("dict_field.Embedded") != nullptr);

    REQUIRE(doc.set("dict_field.Embedded.string_field", "Hello World").has_value());
    REQUIRE(doc.changed_paths() == paths{"dict_field.Embedded.string_field"});
    REQUIRE(unordered(doc.delta().sets) == unordered(wire(R"({"dict_field.Embedded.string_field": "Hello World"})")));
  }
}

TEST_CASE("delta and changed paths use storage names", "[delta]") {
  storage::memory_database db;
  auto doc = saved_and_loaded(db, *models().alias_doc);

  REQUIRE(doc.set("title", "t1").has_value());
  REQUIRE(doc.set("inner", embedded_sample()).has_value());
  REQUIRE(doc.changed_paths() == paths{"i", "t"});
  REQUIRE(doc.delta().sets.contains("t"));
  REQUIRE(doc.delta().sets.contains("i"));
  save_and_reload(db, doc);

  REQUIRE(doc.set("inner.string_field", "x").has_value());
  REQUIRE(doc.append("items", "a").has_value());
  REQUIRE(doc.changed_paths() == paths{"i.string_field", "it"});
  REQUIRE(unordered(doc.delta().sets) == unordered(wire(R"({"i.string_field": "x", "it": ["a"]})")));

  auto stored = doc.to_storage();
  REQUIRE(stored.begin().key() == "_id");
  REQUIRE(stored.contains("t"));
  REQUIRE_FALSE(stored.contains("title"));
}

TEST_CASE("list element mutations", "[delta]") {
  storage::memory_database db;
  auto doc = saved_and_loaded(db, *models().doc);
  REQUIRE(doc.set("list_field", value::list{value("a"), value("b"), value("c")}).has_value());
  save_and_reload(db, doc);

  SECTION("assignment marks the element") {
    REQUIRE(doc.set("list_field.1", "B").has_value());
    REQUIRE(doc.changed_paths() == paths{"list_field.1"});
    REQUIRE(unordered(doc.delta().sets) == unordered(wire(R"({"list_field.1": "B"})")));
  }
  SECTION("removal marks the whole list") {
    REQUIRE(doc.unset("list_field.0").has_value());
    REQUIRE(doc.changed_paths() == paths{"list_field"});
    REQUIRE(unordered(doc.delta().sets) == unordered(wire(R"({"list_field": ["b", "c"]})")));
  }
  SECTION("out of range") {
    auto r = doc.set("list_field.7", "x");
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == core::error_code::invalid_argument);
    REQUIRE(doc.changed_paths().empty());
  }
  SECTION("unknown fields") {
    auto r = doc.set("missing", 1);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == core::error_code::invalid_argument);
  }
}

TEST_CASE("fresh documents report their full storage form", "[delta]") {
  document doc(*models().doc);
  REQUIRE(doc.state() == document_state::fresh);
  REQUIRE(doc.set("string_field", "s").has_value());
  auto d = doc.delta();
  REQUIRE(unordered(d.sets) == unordered(wire(R"({"string_field": "s"})")));
  REQUIRE(d.unsets.empty());
  REQUIRE(doc.id().is_null());
  REQUIRE_FALSE(doc.to_reference().has_value());
}

TEST_CASE("copies keep their own change tracking", "[delta]") {
  storage::memory_database db;
  auto doc = saved_and_loaded(db, *models().doc);
  REQUIRE(doc.set("embedded_field", embedded_sample()).has_value());
  save_and_reload(db, doc);

  document copy = doc;
  REQUIRE(copy.set("embedded_field.string_field", "copy").has_value());
  REQUIRE(copy.changed_paths() == paths{"embedded_field.string_field"});
  REQUIRE(doc.changed_paths().empty());
  REQUIRE(*doc.get("embedded_field.string_field")->as_string() == "hello");
}

TEST_CASE("reassigning a whole list absorbs element changes", "[delta]") {
  storage::memory_database db;
  auto doc = saved_and_loaded(db, *models().person);
  auto address = [](const char* city) {
    embedded_document a(*models().address);
    REQUIRE(a.set("city", city).has_value());
    return value(std::move(a));
  };

  SECTION("element change after the reassignment") {
    REQUIRE(doc.set("addresses", value::list{address("A"), address("B"), address("C")}).has_value());
    REQUIRE(doc.set("addresses.2.city", "Rome").has_value());
    REQUIRE(doc.changed_paths() == paths{"addresses"});
    auto d = doc.delta();
    REQUIRE(unordered(d.sets) ==
            unordered(wire(R"({"addresses": [{"city": "A"}, {"city": "B"}, {"city": "Rome"}]})")));
    REQUIRE(d.unsets.empty());
  }
  SECTION("element change on its own") {
    REQUIRE(doc.set("addresses", value::list{address("A"), address("B"), address("C")}).has_value());
    save_and_reload(db, doc);
    REQUIRE(doc.set("addresses.2.city", "Rome").has_value());
    REQUIRE(doc.changed_paths() == paths{"addresses.2.city"});
    REQUIRE(unordered(doc.delta().sets) == unordered(wire(R"({"addresses.2.city": "Rome"})")));
  }
  SECTION("element change before the reassignment") {
    REQUIRE(doc.set("addresses", value::list{address("A"), address("B"), address("C")}).has_value());
    save_and_reload(db, doc);
    REQUIRE(doc.set("addresses.2.city", "Rome").has_value());
    REQUIRE(doc.set("addresses", value::list{address("Z")}).has_value());
    REQUIRE(doc.changed_paths() == paths{"addresses"});
    REQUIRE(unordered(doc.delta().sets) == unordered(wire(R"({"addresses": [{"city": "Z"}]})")));
  }
}

TEST_CASE("mutually referencing documents serialize identifiers only", "[delta][reference]") {
  storage::memory_database db;
  document a(*models().person);
  document b(*models().person);
  REQUIRE(a.set("name", "a").has_value());
  REQUIRE(b.set("name", "b").has_value());
  REQUIRE(a.save(db).has_value());
  REQUIRE(b.save(db).has_value());

  REQUIRE(a.set("best_friend", *b.to_reference()).has_value());
  REQUIRE(b.set("best_friend", *a.to_reference()).has_value());

  wire_value to_b = wire_value::object();
  to_b["best_friend"] = b.id();
  wire_value to_a = wire_value::object();
  to_a["best_friend"] = a.id();
  REQUIRE(unordered(a.delta().sets) == unordered(to_b));
  REQUIRE(unordered(b.delta().sets) == unordered(to_a));

  document fresh(*models().person);
  REQUIRE(fresh.set("best_friend", *a.to_reference()).has_value());
  const auto stored = fresh.delta().sets;
  REQUIRE(stored["best_friend"] == a.id());
  REQUIRE(stored["best_friend"].is_string());
}
