// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <algorithm>
#include <cmath>
#include <format>
#include <string_view>

namespace sc {

struct Point {
  double x;
  double y;

  auto is_finite() const -> bool { return std::isfinite(x) && std::isfinite(y); }

  bool operator==(const Point& other) const = default;
};

// Axis-aligned clip window. Bounds are inclusive and may describe a window of zero width or
// height.
struct Rectangle {
  double x_min;
  double y_min;
  double x_max;
  double y_max;

  auto width() const -> double { return x_max - x_min; }
  auto height() const -> double { return y_max - y_min; }

  // All bounds finite and x_min <= x_max, y_min <= y_max
  auto is_well_formed() const -> bool {
    return std::isfinite(x_min) && std::isfinite(y_min) && std::isfinite(x_max) &&
           std::isfinite(y_max) && x_min <= x_max && y_min <= y_max;
  }

  auto contains(Point point) const -> bool {
    return x_min <= point.x && point.x <= x_max && y_min <= point.y && point.y <= y_max;
  }

  bool operator==(const Rectangle& other) const = default;
};

// A line segment between two endpoints. The order of the endpoints carries no geometric meaning
// but is preserved by every operation on segments.
struct Line {
  Point p1;
  Point p2;

  auto is_finite() const -> bool { return p1.is_finite() && p2.is_finite(); }
  auto reversed() const -> Line { return Line{p2, p1}; }

  bool operator==(const Line& other) const = default;
};

} // namespace sc

// The format spec applies to every coordinate, e.g. std::format("{:.1f}", point) yields
// "(100.0, 150.0)".
template <> struct std::formatter<sc::Point> : std::formatter<double> {
  template <class FormatContext>
  auto format(const sc::Point& point, FormatContext& ctx) const
      -> typename FormatContext::iterator {
    auto out = ctx.out();
    *out++ = '(';
    ctx.advance_to(out);
    out = std::formatter<double>::format(point.x, ctx);
    out = std::ranges::copy(std::string_view{", "}, out).out;
    ctx.advance_to(out);
    out = std::formatter<double>::format(point.y, ctx);
    *out++ = ')';
    return out;
  }
};

template <> struct std::formatter<sc::Line> : std::formatter<sc::Point> {
  template <class FormatContext>
  auto format(const sc::Line& line, FormatContext& ctx) const
      -> typename FormatContext::iterator {
    auto out = ctx.out();
    *out++ = '[';
    ctx.advance_to(out);
    out = std::formatter<sc::Point>::format(line.p1, ctx);
    out = std::ranges::copy(std::string_view{", "}, out).out;
    ctx.advance_to(out);
    out = std::formatter<sc::Point>::format(line.p2, ctx);
    *out++ = ']';
    return out;
  }
};

template <> struct std::formatter<sc::Rectangle> : std::formatter<double> {
  template <class FormatContext>
  auto format(const sc::Rectangle& window, FormatContext& ctx) const
      -> typename FormatContext::iterator {
    const auto interval = [&](double low, double high) {
      auto out = ctx.out();
      *out++ = '[';
      ctx.advance_to(out);
      out = std::formatter<double>::format(low, ctx);
      out = std::ranges::copy(std::string_view{", "}, out).out;
      ctx.advance_to(out);
      out = std::formatter<double>::format(high, ctx);
      *out++ = ']';
      ctx.advance_to(out);
      return out;
    };
    interval(window.x_min, window.x_max);
    ctx.advance_to(std::ranges::copy(std::string_view{" x "}, ctx.out()).out);
    return interval(window.y_min, window.y_max);
  }
};
