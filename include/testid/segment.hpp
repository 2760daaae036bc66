#pragma once

/**
 * \file segment.hpp
 * \brief One (type, value) level of a hierarchical test identifier.
 *
 * A segment stores both strings verbatim. Reserved delimiter characters are
 * legal here; the codec escapes them when the owning UniqueId is rendered.
 */

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>

namespace testid {

/** \brief Immutable (type, value) pair with value semantics. */
class Segment {
public:
  /**
   * \brief Create a segment from the supplied type and value.
   * \param type kind of hierarchy level, e.g. "engine", "class", "method"
   * \param value name of the artifact at this level
   */
  Segment(std::string type, std::string value);

  [[nodiscard]] auto type() const noexcept -> const std::string& { return type_; }
  [[nodiscard]] auto value() const noexcept -> const std::string& { return value_; }

  /** \brief Hash of the type combined with the hash of the value. */
  [[nodiscard]] auto hash() const noexcept -> std::size_t;

  /** \brief Diagnostic rendering: `Segment [type = 'class', value = 'Foo']`. */
  [[nodiscard]] auto to_debug_string() const -> std::string;

  friend bool operator==(const Segment& a, const Segment& b) = default;

  // Orders by type, then by value.
  friend auto operator<(const Segment& a, const Segment& b) -> bool {
    if (a.type_ != b.type_) return a.type_ < b.type_;
    return a.value_ < b.value_;
  }

private:
  std::string type_;
  std::string value_;
};

auto operator<<(std::ostream& os, const Segment& segment) -> std::ostream&;

namespace detail {

// Same mixing as a 31-based polynomial string hash, applied to size_t words.
constexpr auto combine_hash(std::size_t seed, std::size_t h) noexcept -> std::size_t {
  return seed * 31u + h;
}

} // namespace detail

} // namespace testid

template <>
struct std::hash<testid::Segment> {
  auto operator()(const testid::Segment& s) const noexcept -> std::size_t { return s.hash(); }
};
