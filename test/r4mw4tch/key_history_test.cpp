#include <doctest/doctest.h>

#include "r4mw4tch/input/key_history.hpp"
#include "r4mw4tch/input/key_names.hpp"

using r4mw4tch::key_history;
using r4mw4tch::key_name;
using r4mw4tch::key_set;

TEST_CASE("key set joins held buttons in byte order") {
  key_set keys;
  CHECK(keys.empty());
  CHECK(keys.joined().empty());

  keys.set(key_name::up);
  keys.set(key_name::a);
  keys.set(key_name::left);
  keys.set(key_name::l);
  CHECK(keys.size() == 4);
  CHECK(keys.joined() == "A+L+Left+Up");

  keys.clear(key_name::left);
  CHECK(keys.joined() == "A+L+Up");
}

TEST_CASE("key names resolve case-insensitively against the allow-list") {
  CHECK(r4mw4tch::key_from_name("start") == key_name::start);
  CHECK(r4mw4tch::key_from_name(" SELECT ") == key_name::select);
  CHECK_FALSE(r4mw4tch::key_from_name("Power").has_value());
  CHECK(std::string(r4mw4tch::key_display_name(key_name::right)) == "Right");

  auto parsed = key_set::parse("Up+a+Power+None");
  CHECK(parsed.joined() == "A+Up");
  CHECK(key_set::from_names({"B", "b"}) == key_set::parse("B"));
}

TEST_CASE("key history ignores empty combinations") {
  key_history history;
  history.push("");
  history.push("None");
  CHECK(history.size() == 0);
  CHECK(history.last() == "None");

  history.push("A");
  CHECK(history.last() == "A");
}

TEST_CASE("key history summarizes the most recent entries oldest first") {
  key_history history;
  for (const char* keys : {"A", "B", "Up", "A+B", "Start", "L"}) {
    history.push(keys);
  }

  CHECK(history.last(5) == "B | Up | A+B | Start | L");
  CHECK(history.last(2) == "Start | L");
  CHECK(history.last(50) == "A | B | Up | A+B | Start | L");
}

TEST_CASE("key history evicts the oldest entry at capacity") {
  key_history history(20);
  for (int i = 0; i < 25; ++i) {
    history.push(i % 2 == 0 ? "A" : "B");
  }

  CHECK(history.size() == 20);
  auto entries = history.entries();
  CHECK(entries.front() == "B");
  CHECK(entries.back() == "A");
}
