#include "testid/segment.hpp"

#include <utility>

namespace testid {

Segment::Segment(std::string type, std::string value)
    : type_(std::move(type)), value_(std::move(value)) {}

auto Segment::hash() const noexcept -> std::size_t {
  std::size_t h = 1;
  h = detail::combine_hash(h, std::hash<std::string>{}(type_));
  h = detail::combine_hash(h, std::hash<std::string>{}(value_));
  return h;
}

auto Segment::to_debug_string() const -> std::string {
  std::string out;
  out.reserve(32 + type_.size() + value_.size());
  out.append("Segment [type = '").append(type_)
     .append("', value = '").append(value_)
     .append("']");
  return out;
}

auto operator<<(std::ostream& os, const Segment& segment) -> std::ostream& {
  return os << segment.to_debug_string();
}

} // namespace testid
