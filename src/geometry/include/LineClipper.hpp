// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "GeometricPrimitives.hpp"
#include "Outcode.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace sc {

struct ClipError : public std::logic_error {
  using std::logic_error::logic_error;
};

// The caller passed a non-finite coordinate or an inverted window.
struct ClipPreconditionError : public ClipError {
  using ClipError::ClipError;
};

// A boundary intersection would have divided by zero, or the refinement loop did not converge.
// Unreachable for inputs that satisfy the preconditions.
struct ClipInvariantError : public ClipError {
  using ClipError::ClipError;
};

enum class Endpoint { First, Second };

enum class ClipDecision { Accepted, Rejected };

// One replacement of an outside endpoint by its intersection with a window boundary.
struct ClipStep {
  Endpoint endpoint;
  Region boundary;
  Point intersection;
  Outcode outcode; // outcode of the intersection point

  bool operator==(const ClipStep& other) const = default;
};

struct ClipTrace {
  ClipDecision decision;
  std::vector<ClipStep> steps;
  std::optional<Line> result;
};

// At most this many boundary clips are applied to a single endpoint before the loop gives up.
inline constexpr std::size_t kMaxClipsPerEndpoint = 4;

// Throws ClipPreconditionError unless all bounds are finite and the window is not inverted.
void validate_window(const Rectangle& window);

/**
 * @brief Intersects the supporting line of a segment with one edge of the window.
 *
 * Uses the parametric form x = x1 + t * dx, y = y1 + t * dy and solves for the fixed coordinate
 * of the edge. The other coordinate is interpolated at full precision.
 *
 * @throws ClipInvariantError if the segment is parallel to the requested edge (dy == 0 for Top
 * and Bottom, dx == 0 for Left and Right).
 */
auto boundary_intersection(const Line& line, Region boundary, const Rectangle& window) -> Point;

/**
 * @brief Clips a segment to an axis-aligned window using the Cohen-Sutherland algorithm.
 *
 * Returns the part of the segment inside the window, boundary included, with its endpoints in
 * the original order. Returns std::nullopt if no part of the segment is visible. A segment lying
 * entirely inside the window is returned unchanged.
 *
 * While both endpoints are outside, the first endpoint is clipped first. Boundaries are tried in
 * the order Top, Bottom, Right, Left.
 *
 * @throws ClipPreconditionError if the window is not well formed or a coordinate is not finite.
 */
auto clip_line(const Line& line, const Rectangle& window) -> std::optional<Line>;

// Same algorithm as clip_line, additionally recording every refinement step.
auto trace_clip_line(const Line& line, const Rectangle& window) -> ClipTrace;

auto to_string(Endpoint endpoint) -> std::string_view;
auto to_string(ClipDecision decision) -> std::string_view;

} // namespace sc
