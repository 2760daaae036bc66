#include "testid/c/testid.h"

#include <cstring>
#include <exception>
#include <expected>
#include <new>
#include <string>
#include <string_view>
#include <utility>

#include "testid/error_mapping.hpp"
#include "testid/unique_id.hpp"

struct testid_unique_id_t {
  testid::UniqueId id;
};

namespace {

// Last error message of the calling thread, exposed by testid_get_last_error().
thread_local std::string g_last_error;

void set_error(std::string_view s) { g_last_error.assign(s.data(), s.size()); }
void clear_error() noexcept { g_last_error.clear(); }

auto fail(testid_status_t status, std::string_view message) -> testid_status_t {
  set_error(message);
  return status;
}

auto fail(const testid::core::error& e) -> testid_status_t {
  return fail(testid::core::to_c_status(e.code), e.message);
}

// Runs fn with the last error cleared; exceptions (allocation failures) become TESTID_E_INTERNAL.
template <typename Fn>
auto guarded(const char* what, Fn&& fn) -> testid_status_t {
  clear_error();
  try {
    return std::forward<Fn>(fn)();
  } catch (const std::exception& e) {
    return fail(TESTID_E_INTERNAL, e.what());
  } catch (...) {
    return fail(TESTID_E_INTERNAL, std::string("unknown error in ") + what);
  }
}

auto emit(testid::core::error_code code, std::string_view message) -> testid_status_t {
  return fail(testid::core::to_c_status(code), message);
}

auto publish(std::expected<testid::UniqueId, testid::core::error> r, testid_unique_id_t** out)
    -> testid_status_t {
  if (!r) return fail(r.error());
  *out = new testid_unique_id_t{std::move(*r)};
  return TESTID_OK;
}

// Size-query protocol shared by every string output.
auto copy_out(std::string_view s, char* out_buffer, size_t buffer_size, size_t* out_required_size)
    -> testid_status_t {
  const size_t required = s.size() + 1; // include NUL
  if (out_required_size) *out_required_size = required;
  if (!out_buffer || buffer_size == 0) return TESTID_OK;
  if (buffer_size < required) {
    return fail(TESTID_E_PRECONDITION_FAILED, "buffer too small");
  }
  std::memcpy(out_buffer, s.data(), s.size());
  out_buffer[s.size()] = '\0';
  return TESTID_OK;
}

} // namespace

extern "C" {

TESTID_C_API const char* testid_get_last_error(void) {
  return g_last_error.empty() ? "" : g_last_error.c_str();
}

TESTID_C_API const char* testid_version(void) {
  return "1.0.0";
}

TESTID_C_API testid_status_t testid_parse(const char* text, testid_unique_id_t** out) {
  if (!out) return fail(TESTID_E_PRECONDITION_FAILED, "out must not be null");
  return guarded("parse", [&] {
    if (!text) return emit(testid::core::error_code::format_invalid, "unique id string must not be null");
    return publish(testid::UniqueId::parse(text), out);
  });
}

TESTID_C_API testid_status_t testid_for_engine(const char* engine_id, testid_unique_id_t** out) {
  if (!out) return fail(TESTID_E_PRECONDITION_FAILED, "out must not be null");
  return guarded("for_engine", [&] {
    if (!engine_id) return emit(testid::core::error_code::validation_failed, "engine id must not be null");
    return publish(testid::UniqueId::for_engine(engine_id), out);
  });
}

TESTID_C_API testid_status_t testid_root(const char* segment_type, const char* value,
                                         testid_unique_id_t** out) {
  if (!out) return fail(TESTID_E_PRECONDITION_FAILED, "out must not be null");
  return guarded("root", [&] {
    if (!segment_type) return emit(testid::core::error_code::validation_failed, "segment type must not be null");
    if (!value) return emit(testid::core::error_code::validation_failed, "segment value must not be null");
    return publish(testid::UniqueId::root(segment_type, value), out);
  });
}

TESTID_C_API testid_status_t testid_append(const testid_unique_id_t* id, const char* segment_type,
                                           const char* value, testid_unique_id_t** out) {
  if (!id || !out) return fail(TESTID_E_PRECONDITION_FAILED, "id and out must not be null");
  return guarded("append", [&] {
    if (!segment_type) return emit(testid::core::error_code::validation_failed, "segment type must not be null");
    if (!value) return emit(testid::core::error_code::validation_failed, "segment value must not be null");
    return publish(id->id.append(segment_type, value), out);
  });
}

TESTID_C_API testid_status_t testid_remove_last_segment(const testid_unique_id_t* id,
                                                        testid_unique_id_t** out) {
  if (!id || !out) return fail(TESTID_E_PRECONDITION_FAILED, "id and out must not be null");
  return guarded("remove_last_segment", [&] { return publish(id->id.remove_last_segment(), out); });
}

TESTID_C_API void testid_destroy(testid_unique_id_t* id) {
  delete id;
}

TESTID_C_API testid_status_t testid_segment_count(const testid_unique_id_t* id, size_t* out_count) {
  if (!id || !out_count) return fail(TESTID_E_PRECONDITION_FAILED, "id and out_count must not be null");
  clear_error();
  *out_count = id->id.size();
  return TESTID_OK;
}

TESTID_C_API testid_status_t testid_get_segment(const testid_unique_id_t* id, size_t index,
                                                char* type_buffer, size_t type_buffer_size,
                                                size_t* out_type_required_size,
                                                char* value_buffer, size_t value_buffer_size,
                                                size_t* out_value_required_size) {
  if (!id) return fail(TESTID_E_PRECONDITION_FAILED, "id must not be null");
  return guarded("get_segment", [&] {
    if (index >= id->id.size()) {
      return fail(TESTID_E_PRECONDITION_FAILED, "segment index out of range");
    }
    const auto& s = id->id.segment(index);
    // Both sizes are reported even when one of the copies fails.
    if (out_type_required_size) *out_type_required_size = s.type().size() + 1;
    if (out_value_required_size) *out_value_required_size = s.value().size() + 1;
    auto st = copy_out(s.type(), type_buffer, type_buffer_size, out_type_required_size);
    if (st != TESTID_OK) return st;
    return copy_out(s.value(), value_buffer, value_buffer_size, out_value_required_size);
  });
}

TESTID_C_API testid_status_t testid_get_engine_id(const testid_unique_id_t* id, int* out_has_engine,
                                                  char* out_buffer, size_t buffer_size,
                                                  size_t* out_required_size) {
  if (!id || !out_has_engine) return fail(TESTID_E_PRECONDITION_FAILED, "id and out_has_engine must not be null");
  return guarded("get_engine_id", [&] {
    const auto engine = id->id.engine_id();
    *out_has_engine = engine ? 1 : 0;
    if (!engine) {
      if (out_required_size) *out_required_size = 0;
      return TESTID_OK;
    }
    return copy_out(*engine, out_buffer, buffer_size, out_required_size);
  });
}

TESTID_C_API testid_status_t testid_format(const testid_unique_id_t* id,
                                           char* out_buffer, size_t buffer_size,
                                           size_t* out_required_size) {
  if (!id) return fail(TESTID_E_PRECONDITION_FAILED, "id must not be null");
  return guarded("format", [&] {
    return copy_out(id->id.to_string(), out_buffer, buffer_size, out_required_size);
  });
}

TESTID_C_API testid_status_t testid_equals(const testid_unique_id_t* a, const testid_unique_id_t* b,
                                           int* out_equal) {
  if (!a || !b || !out_equal) return fail(TESTID_E_PRECONDITION_FAILED, "arguments must not be null");
  clear_error();
  *out_equal = (a->id == b->id) ? 1 : 0;
  return TESTID_OK;
}

TESTID_C_API testid_status_t testid_hash(const testid_unique_id_t* id, uint64_t* out_hash) {
  if (!id || !out_hash) return fail(TESTID_E_PRECONDITION_FAILED, "id and out_hash must not be null");
  clear_error();
  *out_hash = static_cast<uint64_t>(id->id.hash());
  return TESTID_OK;
}

} // extern "C"
