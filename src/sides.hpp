#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace plotlayout
{
enum class side : std::size_t
{
  top = 0,
  bottom = 1,
  left = 2,
  right = 3
};

// sizes in pixels, indexed by side
using side_sizes = std::array<std::uint32_t, 4>;

constexpr std::size_t index(side s) noexcept { return static_cast<std::size_t>(s); }

constexpr std::uint32_t &at(side_sizes &sizes, side s) noexcept { return sizes[index(s)]; }
constexpr std::uint32_t at(const side_sizes &sizes, side s) noexcept { return sizes[index(s)]; }

constexpr std::uint64_t horizontal_sum(const side_sizes &sizes) noexcept
{
  return std::uint64_t{at(sizes, side::left)} + at(sizes, side::right);
}

constexpr std::uint64_t vertical_sum(const side_sizes &sizes) noexcept
{
  return std::uint64_t{at(sizes, side::top)} + at(sizes, side::bottom);
}
} // namespace plotlayout
