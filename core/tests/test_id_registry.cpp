#include "doctest/doctest.h"
#include "trayctx/error.hpp"
#include "trayctx/id_registry.hpp"
#include <iterator>
#include <map>
#include <random>
#include <set>

using namespace trayctx;

DOCTEST_TEST_CASE("IdRegistry hands out ids from 1 per id-space") {
  IdRegistry reg;
  auto a = reg.allocate(IdSpace::MenuItem);
  auto b = reg.allocate(IdSpace::MenuItem);
  auto icon = reg.allocate(IdSpace::Icon);

  DOCTEST_REQUIRE_EQ(a.second, 1u);
  DOCTEST_REQUIRE_EQ(b.second, 2u);
  DOCTEST_REQUIRE_EQ(icon.second, 1u);
  DOCTEST_REQUIRE(a.first != b.first);
  DOCTEST_REQUIRE(a.first.space() == IdSpace::MenuItem);
  DOCTEST_REQUIRE(icon.first.space() == IdSpace::Icon);

  DOCTEST_REQUIRE_EQ(*reg.resolve_native(b.first), 2u);
  DOCTEST_REQUIRE(*reg.resolve_token(IdSpace::MenuItem, 1) == a.first);
  DOCTEST_REQUIRE(*reg.resolve_token(IdSpace::Icon, 1) == icon.first);
  DOCTEST_REQUIRE(!reg.resolve_token(IdSpace::Notification, 1));
  DOCTEST_REQUIRE_EQ(reg.live(IdSpace::MenuItem), 2u);
}

DOCTEST_TEST_CASE("IdRegistry reuses the smallest released id") {
  IdRegistry reg;
  auto a = reg.allocate(IdSpace::Icon);
  auto b = reg.allocate(IdSpace::Icon);
  auto c = reg.allocate(IdSpace::Icon);
  DOCTEST_REQUIRE_EQ(c.second, 3u);

  reg.release(c.first);
  reg.release(a.first);
  DOCTEST_REQUIRE(!reg.resolve_native(a.first));
  DOCTEST_REQUIRE(!reg.resolve_token(IdSpace::Icon, 1));

  auto d = reg.allocate(IdSpace::Icon);
  auto e = reg.allocate(IdSpace::Icon);
  auto f = reg.allocate(IdSpace::Icon);
  DOCTEST_REQUIRE_EQ(d.second, 1u);
  DOCTEST_REQUIRE_EQ(e.second, 3u);
  DOCTEST_REQUIRE_EQ(f.second, 4u);
  // Released tokens never come back.
  DOCTEST_REQUIRE(d.first != a.first);
  DOCTEST_REQUIRE_EQ(*reg.resolve_native(b.first), 2u);
}

DOCTEST_TEST_CASE("IdRegistry binds tokens minted elsewhere") {
  IdRegistry reg;
  Token t = Token::mint(IdSpace::Notification);
  DOCTEST_REQUIRE(!reg.resolve_native(t));

  native_id id = reg.bind(t);
  DOCTEST_REQUIRE_EQ(id, 1u);
  DOCTEST_REQUIRE_EQ(reg.bind(t), 1u);
  DOCTEST_REQUIRE_EQ(reg.live(IdSpace::Notification), 1u);

  DOCTEST_REQUIRE_THROWS_AS(reg.bind(Token()), Error);

  // Unknown tokens are ignored.
  reg.release(Token::mint(IdSpace::Notification));
  DOCTEST_REQUIRE_EQ(reg.live(IdSpace::Notification), 1u);
}

DOCTEST_TEST_CASE("IdRegistry reports exhaustion") {
  IdRegistry reg;
  DOCTEST_REQUIRE_EQ(reg.limit(IdSpace::MenuItem), MAX_MENU_ITEM_ID);
  reg.set_limit(IdSpace::MenuItem, 2);

  auto a = reg.allocate(IdSpace::MenuItem);
  reg.allocate(IdSpace::MenuItem);

  bool threw = false;
  try {
    reg.allocate(IdSpace::MenuItem);
  } catch (const Error &e) {
    threw = true;
    DOCTEST_REQUIRE(e.code() == ErrorCode::IdExhausted);
  }
  DOCTEST_REQUIRE(threw);

  // Other spaces are unaffected.
  DOCTEST_REQUIRE_EQ(reg.allocate(IdSpace::Icon).second, 1u);

  reg.release(a.first);
  DOCTEST_REQUIRE_EQ(reg.allocate(IdSpace::MenuItem).second, 1u);
}

DOCTEST_TEST_CASE("Token formatting and ordering") {
  Token a = Token::mint(IdSpace::Icon);
  Token b = Token::mint(IdSpace::Icon);
  DOCTEST_REQUIRE(a.valid());
  DOCTEST_REQUIRE(!Token().valid());
  DOCTEST_REQUIRE(a < b);
  DOCTEST_REQUIRE_EQ(a.to_string(), "icon#" + std::to_string(a.serial()));
  DOCTEST_REQUIRE_EQ(std::string(error_code_str(ErrorCode::IdExhausted)),
                     "E_ID_EXHAUSTED");
}

DOCTEST_TEST_CASE("IdRegistry keeps live ids distinct and dense under churn") {
  IdRegistry reg;
  std::mt19937 rng(20240611);
  std::map<native_id, Token> live;

  for (int step = 0; step < 2000; step++) {
    bool grow = live.empty() || rng() % 3 != 0;
    if (grow) {
      native_id expected = 1;
      while (live.count(expected))
        expected++;
      auto got = reg.allocate(IdSpace::MenuItem);
      DOCTEST_REQUIRE_EQ(got.second, expected);
      DOCTEST_REQUIRE(live.emplace(got.second, got.first).second);
    } else {
      auto it = live.begin();
      std::advance(it, rng() % live.size());
      reg.release(it->second);
      live.erase(it);
    }
    DOCTEST_REQUIRE_EQ(reg.live(IdSpace::MenuItem), live.size());
  }

  std::set<Token> tokens;
  for (const auto &entry : live) {
    DOCTEST_REQUIRE(tokens.insert(entry.second).second);
    DOCTEST_REQUIRE_EQ(*reg.resolve_native(entry.second), entry.first);
  }
}
