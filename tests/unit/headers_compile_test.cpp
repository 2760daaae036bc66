#include <testid/unique_id.hpp>
#include <testid/unique_id_format.hpp>
#include <testid/segment.hpp>
#include <testid/error.hpp>
#include <testid/c/testid.h>
#include <catch2/catch_all.hpp>

TEST_CASE("headers compile and basic types exist", "[headers]") {
  testid::format_delimiters d{};
  REQUIRE(d.segment_separator == '/');
  REQUIRE(testid::UniqueId::engine_segment_type == "engine");
  REQUIRE(TESTID_C_ABI_VERSION == 1);
}
