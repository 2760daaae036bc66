#include "testid/unique_id_format.hpp"

#include <array>
#include <cctype>
#include <utility>
#include <vector>

#include "preconditions.hpp"

namespace testid {

namespace {

using core::error;
using core::error_code;

constexpr auto kComponent = "unique_id.format";

auto format_error(std::size_t offset, std::string_view detail, std::string_view piece) -> error {
  std::string msg = "unique id parse error at offset " + std::to_string(offset) + ": ";
  msg.append(detail);
  if (!piece.empty()) msg.append(" in segment \"").append(piece).append("\"");
  return error{error_code::format_invalid, std::move(msg), kComponent};
}

// Position of the first c at or after from that is not preceded by an escape.
// A dangling escape at the end is left for unescape() to report.
auto find_unescaped(std::string_view s, char c, char esc, std::size_t from = 0) -> std::size_t {
  for (std::size_t i = from; i < s.size(); ++i) {
    if (s[i] == esc) { ++i; continue; }
    if (s[i] == c) return i;
  }
  return std::string_view::npos;
}

auto describe(char c) -> std::string {
  return std::string("'") + c + "'";
}

} // namespace

UniqueIdFormat::UniqueIdFormat(const format_delimiters& delimiters) : d_(delimiters) {}

auto UniqueIdFormat::get_default() -> const std::shared_ptr<const UniqueIdFormat>& {
  static const std::shared_ptr<const UniqueIdFormat> instance(new UniqueIdFormat(format_delimiters{}));
  return instance;
}

auto UniqueIdFormat::create(const format_delimiters& delimiters)
    -> std::expected<std::shared_ptr<const UniqueIdFormat>, core::error> {
  const std::array<char, 5> chars{delimiters.open_segment, delimiters.close_segment,
                                  delimiters.type_value_separator, delimiters.segment_separator,
                                  delimiters.escape};
  for (std::size_t i = 0; i < chars.size(); ++i) {
    const auto uc = static_cast<unsigned char>(chars[i]);
    if (std::isspace(uc) || std::iscntrl(uc)) {
      return std::unexpected(error{error_code::config_invalid,
                                   "delimiter must be a printable, non-space character",
                                   kComponent});
    }
    for (std::size_t j = i + 1; j < chars.size(); ++j) {
      if (chars[i] == chars[j]) {
        return std::unexpected(error{error_code::config_invalid,
                                     "delimiters must be distinct, " + describe(chars[i]) + " is used twice",
                                     kComponent});
      }
    }
  }
  return std::shared_ptr<const UniqueIdFormat>(new UniqueIdFormat(delimiters));
}

auto UniqueIdFormat::is_reserved(char c) const noexcept -> bool {
  return c == d_.open_segment || c == d_.close_segment || c == d_.type_value_separator ||
         c == d_.segment_separator || c == d_.escape;
}

auto UniqueIdFormat::escape(std::string_view raw) const -> std::string {
  std::string out;
  out.reserve(raw.size() + 4);
  for (char c : raw) {
    if (is_reserved(c)) out.push_back(d_.escape);
    out.push_back(c);
  }
  return out;
}

auto UniqueIdFormat::unescape(std::string_view escaped) const
    -> std::expected<std::string, core::error> {
  return unescape_at(escaped, 0, {});
}

auto UniqueIdFormat::unescape_at(std::string_view escaped, std::size_t offset,
                                 std::string_view piece) const
    -> std::expected<std::string, core::error> {
  std::string out;
  out.reserve(escaped.size());
  for (std::size_t i = 0; i < escaped.size(); ++i) {
    const char c = escaped[i];
    if (c == d_.escape) {
      if (i + 1 == escaped.size()) {
        return std::unexpected(format_error(offset + i, "dangling escape character", piece));
      }
      const char next = escaped[i + 1];
      if (!is_reserved(next)) {
        return std::unexpected(format_error(offset + i, "invalid escape sequence " + describe(d_.escape) +
                                                            " followed by " + describe(next), piece));
      }
      out.push_back(next);
      ++i;
    } else if (is_reserved(c)) {
      return std::unexpected(format_error(offset + i, "unescaped reserved character " + describe(c), piece));
    } else {
      out.push_back(c);
    }
  }
  return out;
}

auto UniqueIdFormat::format(const UniqueId& id) const -> std::string {
  std::string out;
  bool first = true;
  for (const auto& s : id.segments_) {
    if (!first) out.push_back(d_.segment_separator);
    first = false;
    out.append(escape(s.type()))
       .append(1, d_.type_value_separator)
       .append(1, d_.open_segment)
       .append(escape(s.value()))
       .append(1, d_.close_segment);
  }
  return out;
}

auto UniqueIdFormat::parse(std::string_view text) const -> std::expected<UniqueId, core::error> {
  if (text.empty()) {
    return std::unexpected(format_error(0, "unique id string must not be empty", {}));
  }

  std::vector<Segment> segments;
  std::size_t start = 0;
  while (true) {
    const auto end = find_unescaped(text, d_.segment_separator, d_.escape, start);
    const auto piece = text.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
    auto seg = parse_segment(piece, start);
    if (!seg) return std::unexpected(std::move(seg.error()));
    segments.push_back(std::move(*seg));
    if (end == std::string_view::npos) break;
    start = end + 1;
  }
  return UniqueId(shared_from_this(), std::move(segments));
}

auto UniqueIdFormat::parse_segment(std::string_view piece, std::size_t offset) const
    -> std::expected<Segment, core::error> {
  if (piece.empty()) {
    return std::unexpected(format_error(offset, "empty segment", {}));
  }

  const auto sep = find_unescaped(piece, d_.type_value_separator, d_.escape);
  if (sep == std::string_view::npos) {
    return std::unexpected(format_error(offset, "missing type/value separator " +
                                                    describe(d_.type_value_separator), piece));
  }
  const auto open = sep + 1;
  if (open >= piece.size() || piece[open] != d_.open_segment) {
    return std::unexpected(format_error(offset + open, "expected " + describe(d_.open_segment) +
                                                           " after type", piece));
  }
  const auto close = find_unescaped(piece, d_.close_segment, d_.escape, open + 1);
  if (close == std::string_view::npos) {
    return std::unexpected(format_error(offset + open, "unmatched " + describe(d_.open_segment), piece));
  }
  if (close + 1 != piece.size()) {
    return std::unexpected(format_error(offset + close + 1, "unexpected characters after " +
                                                                describe(d_.close_segment), piece));
  }

  const auto type_text = piece.substr(0, sep);
  const auto value_text = piece.substr(open + 1, close - open - 1);

  auto type = unescape_at(type_text, offset, piece);
  if (!type) return std::unexpected(std::move(type.error()));
  auto value = unescape_at(value_text, offset + open + 1, piece);
  if (!value) return std::unexpected(std::move(value.error()));
  if (detail::is_blank(*type)) {
    return std::unexpected(format_error(offset, "segment type must not be empty or blank", piece));
  }
  if (detail::is_blank(*value)) {
    return std::unexpected(format_error(offset + open + 1, "segment value must not be empty or blank", piece));
  }
  return Segment(std::move(*type), std::move(*value));
}

} // namespace testid
