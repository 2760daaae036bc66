#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include "testid/c/testid.h"

namespace {

auto formatted(const testid_unique_id_t* id) -> std::string {
  size_t required = 0;
  REQUIRE(testid_format(id, nullptr, 0, &required) == TESTID_OK);
  std::vector<char> buf(required);
  REQUIRE(testid_format(id, buf.data(), buf.size(), nullptr) == TESTID_OK);
  return std::string(buf.data());
}

} // namespace

TEST_CASE("c api builds, renders and releases ids", "[c_api]") {
  testid_unique_id_t* engine = nullptr;
  REQUIRE(testid_for_engine("demo-engine", &engine) == TESTID_OK);
  REQUIRE(engine != nullptr);

  testid_unique_id_t* cls = nullptr;
  REQUIRE(testid_append(engine, "class", "com.example.Foo", &cls) == TESTID_OK);
  testid_unique_id_t* method = nullptr;
  REQUIRE(testid_append(cls, "method", "bar()", &method) == TESTID_OK);

  REQUIRE(formatted(engine) == "engine:[demo-engine]");
  REQUIRE(formatted(method) == "engine:[demo-engine]/class:[com.example.Foo]/method:[bar()]");

  size_t count = 0;
  REQUIRE(testid_segment_count(method, &count) == TESTID_OK);
  REQUIRE(count == 3);
  REQUIRE(testid_segment_count(engine, &count) == TESTID_OK);
  REQUIRE(count == 1);

  char type[16];
  char value[32];
  size_t type_len = 0, value_len = 0;
  REQUIRE(testid_get_segment(method, 1, type, sizeof(type), &type_len, value, sizeof(value), &value_len) == TESTID_OK);
  REQUIRE(std::string(type) == "class");
  REQUIRE(std::string(value) == "com.example.Foo");
  REQUIRE(type_len == 6);
  REQUIRE(value_len == 16);
  REQUIRE(testid_get_segment(method, 3, type, sizeof(type), nullptr, value, sizeof(value), nullptr) == TESTID_E_PRECONDITION_FAILED);

  int has_engine = 0;
  char engine_buf[32];
  REQUIRE(testid_get_engine_id(method, &has_engine, engine_buf, sizeof(engine_buf), nullptr) == TESTID_OK);
  REQUIRE(has_engine == 1);
  REQUIRE(std::string(engine_buf) == "demo-engine");

  testid_unique_id_t* parent = nullptr;
  REQUIRE(testid_remove_last_segment(method, &parent) == TESTID_OK);
  int equal = 0;
  REQUIRE(testid_equals(parent, cls, &equal) == TESTID_OK);
  REQUIRE(equal == 1);

  std::uint64_t h1 = 0, h2 = 0;
  REQUIRE(testid_hash(parent, &h1) == TESTID_OK);
  REQUIRE(testid_hash(cls, &h2) == TESTID_OK);
  REQUIRE(h1 == h2);

  testid_destroy(parent);
  testid_destroy(method);
  testid_destroy(cls);
  testid_destroy(engine);
  testid_destroy(nullptr);
}

TEST_CASE("c api parse round trips and reports engine absence", "[c_api]") {
  testid_unique_id_t* id = nullptr;
  REQUIRE(testid_parse("suite:[a\\/b]/case:[x]", &id) == TESTID_OK);
  REQUIRE(formatted(id) == "suite:[a\\/b]/case:[x]");

  int has_engine = 1;
  size_t required = 99;
  REQUIRE(testid_get_engine_id(id, &has_engine, nullptr, 0, &required) == TESTID_OK);
  REQUIRE(has_engine == 0);
  REQUIRE(required == 0);

  testid_unique_id_t* root = nullptr;
  REQUIRE(testid_root("suite", "a/b", &root) == TESTID_OK);
  testid_unique_id_t* other = nullptr;
  REQUIRE(testid_append(root, "case", "x", &other) == TESTID_OK);
  int equal = 0;
  REQUIRE(testid_equals(id, other, &equal) == TESTID_OK);
  REQUIRE(equal == 1);

  testid_destroy(other);
  testid_destroy(root);
  testid_destroy(id);
}

TEST_CASE("c api maps null and invalid arguments to status codes", "[c_api][errors]") {
  testid_unique_id_t* out = nullptr;

  REQUIRE(testid_parse(nullptr, &out) == TESTID_E_FORMAT_INVALID);
  REQUIRE(std::string(testid_get_last_error()).find("null") != std::string::npos);
  REQUIRE(testid_parse("", &out) == TESTID_E_FORMAT_INVALID);
  REQUIRE(testid_parse("engine[x]", &out) == TESTID_E_FORMAT_INVALID);
  REQUIRE(testid_parse("engine:[x", &out) == TESTID_E_FORMAT_INVALID);
  REQUIRE(out == nullptr);

  REQUIRE(testid_root(nullptr, "v", &out) == TESTID_E_VALIDATION_FAILED);
  REQUIRE(testid_root("", "v", &out) == TESTID_E_VALIDATION_FAILED);
  REQUIRE(testid_root("t", "", &out) == TESTID_E_VALIDATION_FAILED);
  REQUIRE(testid_for_engine(nullptr, &out) == TESTID_E_VALIDATION_FAILED);
  REQUIRE(testid_for_engine("  ", &out) == TESTID_E_VALIDATION_FAILED);
  REQUIRE(out == nullptr);

  REQUIRE(testid_root("t", "v", nullptr) == TESTID_E_PRECONDITION_FAILED);

  testid_unique_id_t* root = nullptr;
  REQUIRE(testid_root("t", "v", &root) == TESTID_OK);
  REQUIRE(std::string(testid_get_last_error()).empty());
  REQUIRE(testid_append(root, nullptr, "v", &out) == TESTID_E_VALIDATION_FAILED);
  REQUIRE(testid_remove_last_segment(root, &out) == TESTID_E_PRECONDITION_FAILED);
  REQUIRE(out == nullptr);

  char tiny[2];
  size_t required = 0;
  REQUIRE(testid_format(root, tiny, sizeof(tiny), &required) == TESTID_E_PRECONDITION_FAILED);
  REQUIRE(required == 6); // "t:[v]" + NUL

  testid_destroy(root);
}

TEST_CASE("c api get_segment reports both sizes when the type buffer is too small", "[c_api][errors]") {
  testid_unique_id_t* id = nullptr;
  REQUIRE(testid_root("t", "value", &id) == TESTID_OK);

  char type[1];
  char value[8];
  size_t type_len = 777, value_len = 777;
  REQUIRE(testid_get_segment(id, 0, type, sizeof(type), &type_len, value, sizeof(value), &value_len) ==
          TESTID_E_PRECONDITION_FAILED);
  REQUIRE(type_len == 2);
  REQUIRE(value_len == 6);

  // A second call sized from the first succeeds.
  std::vector<char> tbuf(type_len), vbuf(value_len);
  REQUIRE(testid_get_segment(id, 0, tbuf.data(), tbuf.size(), nullptr, vbuf.data(), vbuf.size(), nullptr) ==
          TESTID_OK);
  REQUIRE(std::string(tbuf.data()) == "t");
  REQUIRE(std::string(vbuf.data()) == "value");

  testid_destroy(id);
}

TEST_CASE("c api version and abi", "[c_api]") {
  REQUIRE(std::string(testid_version()) == "1.0.0");
  REQUIRE(TESTID_C_ABI_VERSION == 1);
}
