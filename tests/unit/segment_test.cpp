#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>
#include <unordered_set>

#include "testid/segment.hpp"

using testid::Segment;

TEST_CASE("segment stores type and value verbatim", "[segment]") {
  Segment s{"class", "com.example.Foo"};
  REQUIRE(s.type() == "class");
  REQUIRE(s.value() == "com.example.Foo");

  // Reserved delimiters are not rejected here; the codec escapes them.
  Segment reserved{"a/b:c", "[x]\\y"};
  REQUIRE(reserved.type() == "a/b:c");
  REQUIRE(reserved.value() == "[x]\\y");
}

TEST_CASE("segment equality is structural", "[segment]") {
  REQUIRE(Segment{"t", "v"} == Segment{"t", "v"});
  REQUIRE(Segment{"t", "v"} != Segment{"t", "w"});
  REQUIRE(Segment{"t", "v"} != Segment{"u", "v"});
  // Swapping fields must not compare equal.
  REQUIRE(Segment{"a", "b"} != Segment{"b", "a"});
}

TEST_CASE("segment hash follows equality and depends on field order", "[segment]") {
  REQUIRE(Segment{"t", "v"}.hash() == Segment{"t", "v"}.hash());
  REQUIRE(std::hash<Segment>{}(Segment{"t", "v"}) == Segment{"t", "v"}.hash());
  REQUIRE(Segment{"a", "b"}.hash() != Segment{"b", "a"}.hash());

  std::unordered_set<Segment> set;
  set.insert(Segment{"method", "run()"});
  set.insert(Segment{"method", "run()"});
  set.insert(Segment{"method", "stop()"});
  REQUIRE(set.size() == 2);
}

TEST_CASE("segment ordering compares type before value", "[segment]") {
  REQUIRE(Segment{"a", "z"} < Segment{"b", "a"});
  REQUIRE(Segment{"a", "a"} < Segment{"a", "b"});
  REQUIRE_FALSE(Segment{"a", "b"} < Segment{"a", "b"});
}

TEST_CASE("segment debug string names both fields", "[segment]") {
  Segment s{"class", "Foo"};
  REQUIRE(s.to_debug_string() == "Segment [type = 'class', value = 'Foo']");
  std::ostringstream os;
  os << s;
  REQUIRE(os.str() == s.to_debug_string());
}
