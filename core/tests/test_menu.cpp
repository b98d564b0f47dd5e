#include "doctest/doctest.h"
#include "trayctx/area.hpp"
#include "trayctx/error.hpp"
#include "trayctx/id_registry.hpp"
#include "trayctx/menu.hpp"

using namespace trayctx;

DOCTEST_TEST_CASE("Menu builds a tree with tokens in depth-first order") {
  Menu m;
  Token open = m.push_entry("Open");
  m.push_separator();
  Menu &more = m.push_submenu("More");
  Token about = more.push_entry("About");
  Token quit = m.push_entry("Quit", {std::nullopt, true});

  DOCTEST_REQUIRE_EQ(m.nodes().size(), 4u);
  DOCTEST_REQUIRE(std::holds_alternative<MenuSeparator>(m.nodes()[1]));
  DOCTEST_REQUIRE(more.token().has_value());
  DOCTEST_REQUIRE(!m.token().has_value());

  auto tokens = m.tokens();
  DOCTEST_REQUIRE_EQ(tokens.size(), 4u);
  DOCTEST_REQUIRE(tokens[0] == open);
  DOCTEST_REQUIRE(tokens[1] == *more.token());
  DOCTEST_REQUIRE(tokens[2] == about);
  DOCTEST_REQUIRE(tokens[3] == quit);

  const MenuEntry *entry = m.find_entry(quit);
  DOCTEST_REQUIRE(entry != nullptr);
  DOCTEST_REQUIRE_EQ(entry->label, "Quit");
  DOCTEST_REQUIRE(*entry->state.checked);
  DOCTEST_REQUIRE(m.find_entry(*more.token()) == nullptr);
}

DOCTEST_TEST_CASE("Menu default applies to the level holding the entry") {
  Menu m;
  Token a = m.push_entry("A");
  Token b = m.push_entry("B");
  Menu &sub = m.push_submenu("Sub");
  Token c = sub.push_entry("C");

  m.set_default(a);
  DOCTEST_REQUIRE(m.is_default(a));

  m.set_default(c);
  DOCTEST_REQUIRE(m.is_default(a));
  DOCTEST_REQUIRE(sub.is_default(c));

  m.set_default(b);
  DOCTEST_REQUIRE(!m.is_default(a));
  DOCTEST_REQUIRE(*m.default_item() == b);
  m.validate();
}

DOCTEST_TEST_CASE("Menu rejects a default that is not one of its entries") {
  Menu m;
  m.push_entry("A");
  Menu &sub = m.push_submenu("Sub");
  m.set_default(*sub.token());

  bool threw = false;
  try {
    m.validate();
  } catch (const Error &e) {
    threw = true;
    DOCTEST_REQUIRE(e.code() == ErrorCode::Config);
  }
  DOCTEST_REQUIRE(threw);

  Menu other;
  Menu &nested = other.push_submenu("Nested");
  nested.set_default(Token::mint(IdSpace::MenuItem));
  DOCTEST_REQUIRE_THROWS_AS(other.validate(), Error);
}

DOCTEST_TEST_CASE("Menu on a registry binds ids as entries are pushed") {
  IdRegistry reg;
  Area area(&reg);
  Menu &m = area.popup_menu();
  Token first = m.push_entry("First");
  Menu &sub = m.push_submenu("Sub");
  Token second = sub.push_entry("Second");

  DOCTEST_REQUIRE_EQ(*reg.resolve_native(first), 1u);
  DOCTEST_REQUIRE_EQ(*reg.resolve_native(*sub.token()), 2u);
  DOCTEST_REQUIRE_EQ(*reg.resolve_native(second), 3u);
  DOCTEST_REQUIRE_EQ(*reg.resolve_native(area.id()), 1u);
  DOCTEST_REQUIRE(&area.popup_menu() == &m);

  // Standalone areas leave binding to the pump.
  Area loose;
  Token t = loose.popup_menu().push_entry("Loose");
  DOCTEST_REQUIRE(!reg.resolve_native(t));
  DOCTEST_REQUIRE(!reg.resolve_native(loose.id()));
}

DOCTEST_TEST_CASE("Menu survives moves of its owner") {
  Area area;
  Menu &m = area.popup_menu();
  Menu &sub = m.push_submenu("Sub");
  Token inner = sub.push_entry("Inner");
  m.set_default(inner);

  Area moved = std::move(area);
  DOCTEST_REQUIRE(moved.menu() != nullptr);
  DOCTEST_REQUIRE(moved.menu()->find_entry(inner) != nullptr);
  moved.menu()->validate();
}
