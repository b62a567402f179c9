#pragma once

#include <utility>

namespace plotlayout
{
// value interval [start, end], mapped onto one pixel axis
template <typename T>
struct value_range final
{
  T start;
  T end;

  bool operator==(const value_range &) const = default;
};

template <typename T>
value_range(T, T) -> value_range<T>;

template <typename T>
constexpr T span(const value_range<T> &r)
{
  return r.end - r.start;
}

// Widens one of the two ranges around its center so that the pair has the aspect ratio
// destination.first : destination.second. Neither range shrinks.
template <typename T, typename S>
constexpr std::pair<value_range<T>, value_range<T>>
centering_ranges(const std::pair<value_range<T>, value_range<T>> &minimum,
                 const std::pair<S, S> &destination)
{
  const auto sx = span(minimum.first);
  const auto sy = span(minimum.second);
  const auto dx = static_cast<T>(destination.first);
  const auto dy = static_cast<T>(destination.second);
  const auto half = dx / (dx + dx);
  if (sx * dy < sy * dx)
  {
    // sx -> sy * dx / dy
    const auto radius = sy * dx / dy * half;
    const auto center = (minimum.first.start + minimum.first.end) * half;
    return {value_range<T>{center - radius, radius + center}, minimum.second};
  }
  // sy -> sx * dy / dx
  const auto radius = sx * dy / dx * half;
  const auto center = (minimum.second.end + minimum.second.start) * half;
  return {minimum.first, value_range<T>{center - radius, radius + center}};
}
} // namespace plotlayout
