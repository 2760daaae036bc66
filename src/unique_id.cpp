#include "testid/unique_id.hpp"

#include <algorithm>
#include <utility>

#include "preconditions.hpp"
#include "testid/unique_id_format.hpp"

namespace testid {

using core::error;
using core::error_code;

UniqueId::UniqueId(std::shared_ptr<const UniqueIdFormat> format, std::vector<Segment> segments)
    : format_(std::move(format)), segments_(std::move(segments)) {}

auto UniqueId::parse(std::string_view text) -> std::expected<UniqueId, core::error> {
  if (detail::is_blank(text)) {
    return std::unexpected(error{error_code::format_invalid,
                                 "unique id string must not be empty or blank", "unique_id"});
  }
  return UniqueIdFormat::get_default()->parse(text);
}

auto UniqueId::for_engine(std::string_view engine_id) -> std::expected<UniqueId, core::error> {
  if (auto ok = detail::require_not_blank(engine_id, "engine id"); !ok) {
    return std::unexpected(std::move(ok.error()));
  }
  return root(engine_segment_type, engine_id);
}

auto UniqueId::root(std::string_view segment_type, std::string_view value)
    -> std::expected<UniqueId, core::error> {
  return root(UniqueIdFormat::get_default(), segment_type, value);
}

auto UniqueId::root(std::shared_ptr<const UniqueIdFormat> format,
                    std::string_view segment_type, std::string_view value)
    -> std::expected<UniqueId, core::error> {
  if (!format) {
    return std::unexpected(error{error_code::precondition_failed, "format must not be null", "unique_id"});
  }
  if (auto ok = detail::require_not_blank(segment_type, "segment type"); !ok) {
    return std::unexpected(std::move(ok.error()));
  }
  if (auto ok = detail::require_not_blank(value, "segment value"); !ok) {
    return std::unexpected(std::move(ok.error()));
  }
  std::vector<Segment> segments;
  segments.emplace_back(std::string(segment_type), std::string(value));
  return UniqueId(std::move(format), std::move(segments));
}

auto UniqueId::engine_id() const -> std::optional<std::string> {
  const auto& r = root_segment();
  if (r.type() != engine_segment_type) return std::nullopt;
  return r.value();
}

auto UniqueId::append(std::string_view segment_type, std::string_view value) const
    -> std::expected<UniqueId, core::error> {
  return append(Segment(std::string(segment_type), std::string(value)));
}

auto UniqueId::append(const Segment& segment) const -> std::expected<UniqueId, core::error> {
  if (auto ok = detail::require_not_blank(segment.type(), "segment type"); !ok) {
    return std::unexpected(std::move(ok.error()));
  }
  if (auto ok = detail::require_not_blank(segment.value(), "segment value"); !ok) {
    return std::unexpected(std::move(ok.error()));
  }
  std::vector<Segment> segments;
  segments.reserve(segments_.size() + 1);
  segments.insert(segments.end(), segments_.begin(), segments_.end());
  segments.push_back(segment);
  return UniqueId(format_, std::move(segments));
}

auto UniqueId::remove_last_segment() const -> std::expected<UniqueId, core::error> {
  if (segments_.size() == 1) {
    return std::unexpected(error{error_code::precondition_failed,
                                 "cannot remove the last segment of a root unique id", "unique_id"});
  }
  return UniqueId(format_, std::vector<Segment>(segments_.begin(), segments_.end() - 1));
}

auto UniqueId::has_prefix(const UniqueId& prefix) const noexcept -> bool {
  if (prefix.segments_.size() > segments_.size()) return false;
  return std::equal(prefix.segments_.begin(), prefix.segments_.end(), segments_.begin());
}

auto UniqueId::to_string() const -> std::string {
  return format_->format(*this);
}

auto UniqueId::hash() const noexcept -> std::size_t {
  std::size_t h = 1;
  for (const auto& s : segments_) h = detail::combine_hash(h, s.hash());
  return h;
}

auto operator<<(std::ostream& os, const UniqueId& id) -> std::ostream& {
  return os << id.to_string();
}

} // namespace testid
