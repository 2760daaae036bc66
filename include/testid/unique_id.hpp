#pragma once

/**
 * \file unique_id.hpp
 * \brief Immutable hierarchical identifiers for test artifacts.
 *
 * A UniqueId is a non-empty, ordered list of segments from root to leaf. It is
 * rendered to (and parsed from) a canonical string by a UniqueIdFormat, e.g.
 *
 *   engine:[demo-engine]/class:[com.example.Foo]/method:[bar()]
 *
 * Thread-safety: instances are immutable; concurrent reads need no locking.
 * No exceptions are thrown; errors are propagated via std::expected.
 *
 * Ownership & lifetime:
 * - Every UniqueId owns its segment list. append() and remove_last_segment()
 *   copy it, so values derived from an id never alias the original.
 * - The bound format is shared (std::shared_ptr) and takes no part in equality.
 */

#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "testid/error.hpp"
#include "testid/segment.hpp"

namespace testid {

class UniqueIdFormat;

class UniqueId {
public:
  /** \brief Segment type marking the root segment of an engine. */
  static constexpr std::string_view engine_segment_type = "engine";

  /**
   * \brief Parse a UniqueId from its canonical string using the default format.
   * \return format_invalid if text is empty, blank, or malformed
   */
  static auto parse(std::string_view text) -> std::expected<UniqueId, core::error>;

  /**
   * \brief Create the root id of a test engine: `engine:[<engine_id>]`.
   * \return validation_failed if engine_id is empty or blank
   */
  static auto for_engine(std::string_view engine_id) -> std::expected<UniqueId, core::error>;

  /**
   * \brief Create a single-segment id bound to the default format.
   * \return validation_failed if segment_type or value is empty or blank
   */
  static auto root(std::string_view segment_type, std::string_view value)
      -> std::expected<UniqueId, core::error>;

  /**
   * \brief Create a single-segment id bound to an alternate format.
   * \return precondition_failed if format is null; validation_failed as above
   */
  static auto root(std::shared_ptr<const UniqueIdFormat> format,
                   std::string_view segment_type, std::string_view value)
      -> std::expected<UniqueId, core::error>;

  /** \brief First segment. Always present: empty ids cannot be constructed. */
  [[nodiscard]] auto root_segment() const noexcept -> const Segment& { return segments_.front(); }

  [[nodiscard]] auto last_segment() const noexcept -> const Segment& { return segments_.back(); }

  /** \brief Root value when the root segment is an engine segment. */
  [[nodiscard]] auto engine_id() const -> std::optional<std::string>;

  /** \brief Copy of the segment list; callers may modify it freely. */
  [[nodiscard]] auto segments() const -> std::vector<Segment> { return segments_; }

  [[nodiscard]] auto size() const noexcept -> std::size_t { return segments_.size(); }

  /** \brief Segment at index, root first. Precondition: index < size(). */
  [[nodiscard]] auto segment(std::size_t index) const noexcept -> const Segment& { return segments_[index]; }

  /**
   * \brief New id with a segment built from segment_type and value appended.
   *
   * This id is not modified. Reserved delimiter characters are allowed and
   * are escaped when the result is rendered.
   * \return validation_failed if segment_type or value is empty or blank
   */
  auto append(std::string_view segment_type, std::string_view value) const
      -> std::expected<UniqueId, core::error>;

  /** \brief New id with segment appended; validated like append(type, value). */
  auto append(const Segment& segment) const -> std::expected<UniqueId, core::error>;

  /**
   * \brief Parent of this id.
   * \return precondition_failed if this id has a single segment
   */
  auto remove_last_segment() const -> std::expected<UniqueId, core::error>;

  /** \brief True if prefix's segments lead this id's segments (an id prefixes itself). */
  [[nodiscard]] auto has_prefix(const UniqueId& prefix) const noexcept -> bool;

  /** \brief Format this id is rendered with. */
  [[nodiscard]] auto unique_id_format() const noexcept -> const UniqueIdFormat& { return *format_; }

  /** \brief Canonical string form produced by the bound format. */
  [[nodiscard]] auto to_string() const -> std::string;

  [[nodiscard]] auto hash() const noexcept -> std::size_t;

  friend auto operator==(const UniqueId& a, const UniqueId& b) -> bool {
    return a.segments_ == b.segments_;
  }

  // Lexicographic over segments; a proper prefix sorts first.
  friend auto operator<(const UniqueId& a, const UniqueId& b) -> bool {
    return a.segments_ < b.segments_;
  }

private:
  friend class UniqueIdFormat;

  UniqueId(std::shared_ptr<const UniqueIdFormat> format, std::vector<Segment> segments);

  std::shared_ptr<const UniqueIdFormat> format_;
  std::vector<Segment> segments_;
};

auto operator<<(std::ostream& os, const UniqueId& id) -> std::ostream&;

} // namespace testid

template <>
struct std::hash<testid::UniqueId> {
  auto operator()(const testid::UniqueId& id) const noexcept -> std::size_t { return id.hash(); }
};
