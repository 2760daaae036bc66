#ifndef TESTID_C_H
#define TESTID_C_H

#ifdef __cplusplus
extern "C" {
#endif

// Symbol visibility
#if defined(_WIN32)
  #if defined(TESTID_C_API_EXPORTS)
    #define TESTID_C_API __declspec(dllexport)
  #else
    #define TESTID_C_API __declspec(dllimport)
  #endif
#else
  #define TESTID_C_API __attribute__((visibility("default")))
#endif

#include <stddef.h>
#include <stdint.h>

// Versioning and stability
// - TESTID_C_ABI_VERSION increments on incompatible changes.
#define TESTID_C_ABI_VERSION 1

// Status codes (same values as the C++ error_code)
typedef enum testid_status_e {
  TESTID_OK = 0,
  TESTID_E_CONFIG_INVALID = 2001,
  TESTID_E_FORMAT_INVALID = 3001,
  TESTID_E_VALIDATION_FAILED = 4001,
  TESTID_E_PRECONDITION_FAILED = 4002,
  TESTID_E_INTERNAL = 9001
} testid_status_t;

// Opaque handles
// - Ownership: every handle returned through an out parameter belongs to the
//   caller and must be released with testid_destroy().
// - Handles are immutable; concurrent reads from several threads are safe.
typedef struct testid_unique_id_t testid_unique_id_t;

// String outputs follow a size-query protocol:
// - *out_required_size (if non-NULL) receives the length including the NUL.
// - A NULL out_buffer or buffer_size == 0 only queries the size.
// - buffer_size smaller than required returns TESTID_E_PRECONDITION_FAILED.
// - Calls with several outputs fill every required size before copying.

// Thread-local message of the last failed call on this thread ("" if none)
TESTID_C_API const char* testid_get_last_error(void);

// Version info (semantic version string, e.g. "1.0.0")
TESTID_C_API const char* testid_version(void);

// Construction. NULL text is a format error; NULL or blank arguments to
// for_engine/root/append are validation errors.
TESTID_C_API testid_status_t testid_parse(const char* text, testid_unique_id_t** out);
TESTID_C_API testid_status_t testid_for_engine(const char* engine_id, testid_unique_id_t** out);
TESTID_C_API testid_status_t testid_root(const char* segment_type, const char* value,
                                         testid_unique_id_t** out);
TESTID_C_API testid_status_t testid_append(const testid_unique_id_t* id, const char* segment_type,
                                           const char* value, testid_unique_id_t** out);
TESTID_C_API testid_status_t testid_remove_last_segment(const testid_unique_id_t* id,
                                                        testid_unique_id_t** out);
TESTID_C_API void testid_destroy(testid_unique_id_t* id);

// Inspection
TESTID_C_API testid_status_t testid_segment_count(const testid_unique_id_t* id, size_t* out_count);
TESTID_C_API testid_status_t testid_get_segment(const testid_unique_id_t* id, size_t index,
                                                char* type_buffer, size_t type_buffer_size,
                                                size_t* out_type_required_size,
                                                char* value_buffer, size_t value_buffer_size,
                                                size_t* out_value_required_size);
// Sets *out_has_engine to 0 and writes nothing when the root is not an engine segment.
TESTID_C_API testid_status_t testid_get_engine_id(const testid_unique_id_t* id, int* out_has_engine,
                                                  char* out_buffer, size_t buffer_size,
                                                  size_t* out_required_size);
TESTID_C_API testid_status_t testid_format(const testid_unique_id_t* id,
                                           char* out_buffer, size_t buffer_size,
                                           size_t* out_required_size);
TESTID_C_API testid_status_t testid_equals(const testid_unique_id_t* a, const testid_unique_id_t* b,
                                           int* out_equal);
TESTID_C_API testid_status_t testid_hash(const testid_unique_id_t* id, uint64_t* out_hash);

#ifdef __cplusplus
}
#endif

#endif // TESTID_C_H
