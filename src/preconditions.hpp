#pragma once

// Argument checks shared by the UniqueId factories and append().

#include <expected>
#include <string>
#include <string_view>

#include "testid/error.hpp"

namespace testid::detail {

// Blank means every byte is a space or an ASCII control character (<= 0x20).
inline auto is_blank(std::string_view s) noexcept -> bool {
  for (unsigned char c : s) {
    if (c > ' ') return false;
  }
  return true;
}

inline auto require_not_blank(std::string_view s, std::string_view what)
    -> std::expected<void, core::error> {
  if (is_blank(s)) {
    return std::unexpected(core::error{core::error_code::validation_failed,
                                       std::string(what) + " must not be empty or blank",
                                       "unique_id"});
  }
  return {};
}

} // namespace testid::detail
