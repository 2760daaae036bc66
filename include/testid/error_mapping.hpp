#pragma once

#include "testid/error.hpp"
#include "testid/c/testid.h"

namespace testid::core {

constexpr testid_status_t to_c_status(error_code ec) {
  switch (ec) {
    case error_code::ok: return TESTID_OK;
    case error_code::config_invalid: return TESTID_E_CONFIG_INVALID;
    case error_code::format_invalid: return TESTID_E_FORMAT_INVALID;
    case error_code::validation_failed: return TESTID_E_VALIDATION_FAILED;
    case error_code::precondition_failed: return TESTID_E_PRECONDITION_FAILED;
    case error_code::internal: return TESTID_E_INTERNAL;
  }
  return TESTID_E_INTERNAL;
}

constexpr error_code from_c_status(testid_status_t st) {
  switch (st) {
    case TESTID_OK: return error_code::ok;
    case TESTID_E_CONFIG_INVALID: return error_code::config_invalid;
    case TESTID_E_FORMAT_INVALID: return error_code::format_invalid;
    case TESTID_E_VALIDATION_FAILED: return error_code::validation_failed;
    case TESTID_E_PRECONDITION_FAILED: return error_code::precondition_failed;
    case TESTID_E_INTERNAL: return error_code::internal;
    default: return error_code::internal;
  }
}

} // namespace testid::core
