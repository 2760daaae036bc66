#pragma once

/**
 * \file unique_id_format.hpp
 * \brief Codec between UniqueId values and their canonical string form.
 *
 * Format (default delimiters):
 *   unique-id := segment ("/" segment)*
 *   segment   := escape(type) ":[" escape(value) "]"
 *
 * escape() prefixes each reserved character (the four delimiters and the
 * escape character itself) with the escape character. Nothing else is
 * escaped, so every id has exactly one encoding.
 *
 * Thread-safety: a format holds only its delimiters and is never mutated;
 * concurrent format()/parse() calls on the same instance are safe.
 */

#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include "testid/error.hpp"
#include "testid/unique_id.hpp"

namespace testid {

/** \brief Delimiter set of a UniqueIdFormat. Defaults match the wire format. */
struct format_delimiters {
  char open_segment{'['};          /**< opens the value part */
  char close_segment{']'};         /**< closes the value part */
  char type_value_separator{':'};  /**< between type and value */
  char segment_separator{'/'};     /**< between segments */
  char escape{'\\'};               /**< prefixes literal reserved characters */
};

class UniqueIdFormat : public std::enable_shared_from_this<UniqueIdFormat> {
public:
  /** \brief Process-wide default format; created on first use, never replaced. */
  static auto get_default() -> const std::shared_ptr<const UniqueIdFormat>&;

  /**
   * \brief Build an alternate format.
   * \return config_invalid if two delimiters coincide or one is whitespace/control
   */
  static auto create(const format_delimiters& delimiters)
      -> std::expected<std::shared_ptr<const UniqueIdFormat>, core::error>;

  [[nodiscard]] auto delimiters() const noexcept -> const format_delimiters& { return d_; }

  /** \brief True for the four delimiters and the escape character. */
  [[nodiscard]] auto is_reserved(char c) const noexcept -> bool;

  /** \brief Render id in canonical form. Never fails. */
  [[nodiscard]] auto format(const UniqueId& id) const -> std::string;

  /**
   * \brief Parse text into a UniqueId bound to this format.
   * \return format_invalid with the offending segment and byte offset in the message
   */
  auto parse(std::string_view text) const -> std::expected<UniqueId, core::error>;

  /** \brief Escape reserved characters of a raw type or value. */
  [[nodiscard]] auto escape(std::string_view raw) const -> std::string;

  /**
   * \brief Inverse of escape().
   * \return format_invalid on a dangling escape, an escaped non-reserved
   *         character, or an unescaped reserved character
   */
  auto unescape(std::string_view escaped) const -> std::expected<std::string, core::error>;

private:
  explicit UniqueIdFormat(const format_delimiters& delimiters);

  auto parse_segment(std::string_view piece, std::size_t offset) const
      -> std::expected<Segment, core::error>;

  // offset and piece locate escaped within the text being parsed, for error messages.
  auto unescape_at(std::string_view escaped, std::size_t offset, std::string_view piece) const
      -> std::expected<std::string, core::error>;

  format_delimiters d_;
};

} // namespace testid
