// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "GeometricPrimitives.hpp"

#include <cstdint>
#include <format>
#include <string>
#include <string_view>

namespace sc {

// The outer half-planes of a clip window. The values are the classic Cohen-Sutherland bits.
enum class Region : std::uint8_t {
  Left = 0b0001,
  Right = 0b0010,
  Bottom = 0b0100,
  Top = 0b1000,
};

auto to_string(Region region) -> std::string_view;

/**
 * @brief The set of window boundaries a point lies beyond.
 *
 * An empty set means the point is inside the window or on its boundary. Left and Right are never
 * both set by compute_outcode, neither are Bottom and Top.
 */
class Outcode {
public:
  constexpr Outcode() noexcept = default;
  constexpr Outcode(Region region) noexcept : mBits(static_cast<std::uint8_t>(region)) {}

  static constexpr auto from_bits(std::uint8_t bits) noexcept -> Outcode {
    Outcode code;
    code.mBits = bits & 0b1111;
    return code;
  }

  constexpr auto bits() const noexcept -> std::uint8_t { return mBits; }
  constexpr auto is_inside() const noexcept -> bool { return mBits == 0; }

  constexpr auto contains(Region region) const noexcept -> bool {
    return (mBits & static_cast<std::uint8_t>(region)) != 0;
  }

  constexpr auto operator|(Outcode other) const noexcept -> Outcode {
    return from_bits(mBits | other.mBits);
  }

  constexpr auto operator&(Outcode other) const noexcept -> Outcode {
    return from_bits(mBits & other.mBits);
  }

  constexpr auto operator|=(Outcode other) noexcept -> Outcode& {
    mBits |= other.mBits;
    return *this;
  }

  constexpr bool operator==(const Outcode& other) const = default;

private:
  std::uint8_t mBits{0};
};

constexpr auto operator|(Region lhs, Region rhs) noexcept -> Outcode {
  return Outcode{lhs} | Outcode{rhs};
}

// Classifies a point against a window, boundary-inclusive.
// Coordinates must be finite.
auto compute_outcode(Point point, const Rectangle& window) noexcept -> Outcode;

// Region names joined by '|', or "INSIDE" for the empty code
auto to_string(Outcode code) -> std::string;

} // namespace sc

template <> struct std::formatter<sc::Outcode> : std::formatter<std::string_view> {
  template <class FormatContext>
  auto format(sc::Outcode code, FormatContext& ctx) const -> typename FormatContext::iterator {
    return std::formatter<std::string_view>::format(sc::to_string(code), ctx);
  }
};

template <> struct std::formatter<sc::Region> : std::formatter<std::string_view> {
  template <class FormatContext>
  auto format(sc::Region region, FormatContext& ctx) const -> typename FormatContext::iterator {
    return std::formatter<std::string_view>::format(sc::to_string(region), ctx);
  }
};
