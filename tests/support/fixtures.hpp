#pragma once

/** \file fixtures.hpp
 *  \brief Document classes shared by the unit tests.
 *
 * The registry is process-wide, so every class is defined once, on first use,
 * and never removed. Test cases get a fresh memory_database each.
 */

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "quarry/registry.hpp"
#include "quarry/schema.hpp"
#include "quarry/wire.hpp"

namespace quarry::test {

/** \brief Order-insensitive view of a wire document, for equality checks. */
inline auto unordered(const wire_value& v) -> nlohmann::json { return nlohmann::json::parse(v.dump()); }

inline auto wire(const char* text) -> wire_value { return wire_value::parse(text); }

inline auto define(std::string name, schema_options opts, std::vector<std::shared_ptr<field>> fields)
    -> const schema* {
  auto s = std::make_shared<schema>(std::move(name), std::move(opts));
  for (auto& f : fields) s->add(std::move(f));
  return &registry::instance().add(std::move(s));
}

struct model {
  const schema* address;
  const schema* person;

  const schema* animal;
  const schema* dog;
  const schema* puppy;

  const schema* embedded;
  const schema* doc;
  const schema* alias_doc;

  const schema* account;

  const schema* blog;
  const schema* post;
  const schema* comment;
  const schema* topic;
  const schema* article;
  const schema* owner;
  const schema* pet;
  const schema* song;
  const schema* playlist;
  const schema* node;

  const schema* shelf;
  const schema* book;

  const schema* site;
  const schema* page;
  const schema* feed;
  const schema* lock;
};

inline auto build_models() -> model {
  model m{};
  m.address = define("Address", {.embedded = true},
                     {std::make_shared<string_field>("street", field_options{.db_field = "s"}),
                      std::make_shared<string_field>("city")});
  m.person = define(
      "Person", {},
      {std::make_shared<string_field>("name"),
       std::make_shared<int_field>("age"),
       std::make_shared<float_field>("score"),
       std::make_shared<list_field>("tags", std::make_shared<string_field>("tags")),
       std::make_shared<dict_field>("info"),
       std::make_shared<dict_field>("ratings", field_options{}, std::make_shared<int_field>("ratings")),
       std::make_shared<embedded_field>("address", "Address"),
       std::make_shared<list_field>("addresses", std::make_shared<embedded_field>("addresses", "Address")),
       std::make_shared<geo_point_field>("location"),
       std::make_shared<point_field>("position"),
       std::make_shared<reference_field>("best_friend", "self"),
       std::make_shared<string_field>("nick", field_options{.db_field = "nk"})});

  m.animal = define("Animal", {.allow_inheritance = true}, {std::make_shared<string_field>("name")});
  m.dog = define("Dog", {.parent = m.animal}, {std::make_shared<string_field>("breed")});
  m.puppy = define("Puppy", {.parent = m.dog}, {std::make_shared<int_field>("months")});

  m.embedded = define("Embedded", {.allow_inheritance = true, .embedded = true},
                      {std::make_shared<string_field>("string_field"),
                       std::make_shared<int_field>("int_field"),
                       std::make_shared<dict_field>("dict_field"),
                       std::make_shared<list_field>("list_field", nullptr)});
  m.doc = define("Doc", {},
                 {std::make_shared<string_field>("string_field"),
                  std::make_shared<int_field>("int_field"),
                  std::make_shared<dict_field>("dict_field"),
                  std::make_shared<list_field>("list_field", nullptr),
                  std::make_shared<embedded_field>("embedded_field", "Embedded")});
  m.alias_doc = define("AliasDoc", {},
                       {std::make_shared<string_field>("title", field_options{.db_field = "t"}),
                        std::make_shared<embedded_field>("inner", "Embedded", field_options{.db_field = "i"}),
                        std::make_shared<list_field>("items", nullptr, field_options{.db_field = "it"})});

  m.account = define("Account", {},
                     {std::make_shared<string_field>("email", field_options{.unique = true}),
                      std::make_shared<int_field>("logins")});

  m.blog = define("Blog", {}, {std::make_shared<string_field>("name")});
  m.post = define("Post", {},
                  {std::make_shared<string_field>("title"),
                   std::make_shared<reference_field>("blog", "Blog", delete_rule::cascade)});
  m.comment = define("Comment", {},
                     {std::make_shared<string_field>("text"),
                      std::make_shared<reference_field>("post", "Post", delete_rule::cascade)});
  m.topic = define("Topic", {}, {std::make_shared<string_field>("name")});
  m.article = define("Article", {},
                     {std::make_shared<string_field>("title"),
                      std::make_shared<reference_field>("topic", "Topic", delete_rule::nullify)});
  m.owner = define("Owner", {}, {std::make_shared<string_field>("name")});
  m.pet = define("Pet", {},
                 {std::make_shared<string_field>("name"),
                  std::make_shared<reference_field>("owner", "Owner", delete_rule::deny)});
  m.song = define("Song", {}, {std::make_shared<string_field>("title")});
  m.playlist = define(
      "Playlist", {},
      {std::make_shared<string_field>("name"),
       std::make_shared<list_field>("songs",
                                    std::make_shared<reference_field>("songs", "Song", delete_rule::pull))});
  m.node = define("Node", {},
                  {std::make_shared<string_field>("label"),
                   std::make_shared<reference_field>("parent", "self", delete_rule::cascade)});

  // User-assigned integer keys, so identifiers repeat across collections.
  m.shelf = define("Shelf", {}, {std::make_shared<int_field>("code", field_options{.primary_key = true})});
  m.book = define("Book", {},
                  {std::make_shared<int_field>("code", field_options{.primary_key = true}),
                   std::make_shared<reference_field>("shelf", "Shelf", delete_rule::cascade)});

  m.site = define("Site", {}, {std::make_shared<string_field>("name")});
  m.page = define("Page", {},
                  {std::make_shared<string_field>("path"),
                   std::make_shared<reference_field>("site", "Site", delete_rule::cascade)});
  m.feed = define("Feed", {},
                  {std::make_shared<string_field>("url"),
                   std::make_shared<reference_field>("site", "Site", delete_rule::cascade)});
  m.lock = define("Lock", {},
                  {std::make_shared<string_field>("reason"),
                   std::make_shared<reference_field>("feed", "Feed", delete_rule::deny)});
  return m;
}

inline auto models() -> const model& {
  static const model m = build_models();
  return m;
}

} // namespace quarry::test
