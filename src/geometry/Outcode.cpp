// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Outcode.hpp"

#include <array>

namespace sc {

auto to_string(Region region) -> std::string_view {
  switch (region) {
  case Region::Left:
    return "LEFT";
  case Region::Right:
    return "RIGHT";
  case Region::Bottom:
    return "BOTTOM";
  case Region::Top:
    return "TOP";
  }
  return "UNKNOWN";
}

auto compute_outcode(Point point, const Rectangle& window) noexcept -> Outcode {
  Outcode code{};
  if (point.x < window.x_min) {
    code |= Region::Left;
  } else if (point.x > window.x_max) {
    code |= Region::Right;
  }
  if (point.y < window.y_min) {
    code |= Region::Bottom;
  } else if (point.y > window.y_max) {
    code |= Region::Top;
  }
  return code;
}

auto to_string(Outcode code) -> std::string {
  if (code.is_inside()) {
    return "INSIDE";
  }
  static constexpr std::array regions = {Region::Left, Region::Right, Region::Bottom, Region::Top};
  std::string result;
  for (Region region : regions) {
    if (code.contains(region)) {
      if (!result.empty()) {
        result += '|';
      }
      result += to_string(region);
    }
  }
  return result;
}

} // namespace sc
