// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "LineClipper.hpp"

#include "Logging.hpp"

#include <array>
#include <cmath>
#include <format>
#include <string>

namespace sc {

namespace {

[[noreturn]] void fail_invariant(std::string message) {
  Log::e("{}", message);
  throw ClipInvariantError(message);
}

void validate_line(const Line& line) {
  if (!line.is_finite()) {
    throw ClipPreconditionError(std::format("segment {} has a non-finite coordinate", line));
  }
}

// Value of the a-coordinate where the segment from (a1, b1) to (a2, b2) reaches b.
// Requires b1 != b2.
auto interpolate(double a1, double a2, double b1, double b2, double b) -> double {
  const double a = a1 + (a2 - a1) * (b - b1) / (b2 - b1);
  if (std::isfinite(a)) {
    return a;
  }
  // The differences overflowed. Halving is exact and keeps every term in range.
  const double t = (b / 2 - b1 / 2) / (b2 / 2 - b1 / 2);
  return 2 * (a1 / 2 + t * (a2 / 2 - a1 / 2));
}

// Top, Bottom, Right, Left
auto select_boundary(Outcode code) -> Region {
  static constexpr std::array priority = {Region::Top, Region::Bottom, Region::Right,
                                          Region::Left};
  for (Region region : priority) {
    if (code.contains(region)) {
      return region;
    }
  }
  fail_invariant(std::format("no boundary to clip for outcode {}", code));
}

// Runs the refinement loop and reports each step to the observer.
template <class StepObserver>
auto clip_with_observer(Line line, const Rectangle& window, StepObserver&& observer)
    -> std::optional<Line> {
  validate_window(window);
  validate_line(line);

  Outcode outcode1 = compute_outcode(line.p1, window);
  Outcode outcode2 = compute_outcode(line.p2, window);
  std::array<std::size_t, 2> clips{};

  while (true) {
    if ((outcode1 | outcode2).is_inside()) {
      return line;
    }
    if (!(outcode1 & outcode2).is_inside()) {
      return std::nullopt;
    }

    const Endpoint endpoint = outcode1.is_inside() ? Endpoint::Second : Endpoint::First;
    const std::size_t index = endpoint == Endpoint::First ? 0 : 1;
    if (++clips[index] > kMaxClipsPerEndpoint) {
      fail_invariant(std::format("clipping {} against {} did not converge", line, window));
    }

    const Region boundary = select_boundary(endpoint == Endpoint::First ? outcode1 : outcode2);
    const Point intersection = boundary_intersection(line, boundary, window);
    const Outcode outcode = compute_outcode(intersection, window);
    if (endpoint == Endpoint::First) {
      line.p1 = intersection;
      outcode1 = outcode;
    } else {
      line.p2 = intersection;
      outcode2 = outcode;
    }
    observer(ClipStep{endpoint, boundary, intersection, outcode});
  }
}

} // namespace

void validate_window(const Rectangle& window) {
  if (!window.is_well_formed()) {
    throw ClipPreconditionError(std::format("clip window {} is not well formed", window));
  }
}

auto boundary_intersection(const Line& line, Region boundary, const Rectangle& window) -> Point {
  const double dx = line.p2.x - line.p1.x;
  const double dy = line.p2.y - line.p1.y;
  Point intersection{};
  switch (boundary) {
  case Region::Top:
  case Region::Bottom: {
    if (dy == 0.0) {
      fail_invariant(std::format("segment {} is parallel to the {} boundary", line, boundary));
    }
    const double y = boundary == Region::Top ? window.y_max : window.y_min;
    intersection = Point{interpolate(line.p1.x, line.p2.x, line.p1.y, line.p2.y, y), y};
    break;
  }
  case Region::Right:
  case Region::Left: {
    if (dx == 0.0) {
      fail_invariant(std::format("segment {} is parallel to the {} boundary", line, boundary));
    }
    const double x = boundary == Region::Right ? window.x_max : window.x_min;
    intersection = Point{x, interpolate(line.p1.y, line.p2.y, line.p1.x, line.p2.x, x)};
    break;
  }
  default:
    fail_invariant("unknown boundary");
  }
  if (!intersection.is_finite()) {
    fail_invariant(std::format("intersection of {} with the {} boundary is not finite", line,
                               boundary));
  }
  return intersection;
}

auto clip_line(const Line& line, const Rectangle& window) -> std::optional<Line> {
  return clip_with_observer(line, window, [](const ClipStep& step) {
    Log::d("clipped {} endpoint at {} boundary to {} ({})", to_string(step.endpoint),
           step.boundary, step.intersection, step.outcode);
  });
}

auto trace_clip_line(const Line& line, const Rectangle& window) -> ClipTrace {
  ClipTrace trace{};
  trace.result =
      clip_with_observer(line, window, [&](const ClipStep& step) { trace.steps.push_back(step); });
  trace.decision = trace.result ? ClipDecision::Accepted : ClipDecision::Rejected;
  return trace;
}

auto to_string(Endpoint endpoint) -> std::string_view {
  switch (endpoint) {
  case Endpoint::First:
    return "first";
  case Endpoint::Second:
    return "second";
  }
  return "unknown";
}

auto to_string(ClipDecision decision) -> std::string_view {
  switch (decision) {
  case ClipDecision::Accepted:
    return "accepted";
  case ClipDecision::Rejected:
    return "rejected";
  }
  return "unknown";
}

} // namespace sc
