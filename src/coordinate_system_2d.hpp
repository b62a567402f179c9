#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <limits>
#include <span>
#include <string>
#include <vector>
#include <glm/vec2.hpp>
#include <glm/vec4.hpp>
#include "colors.hpp"
#include "drawing_area.hpp"
#include "errors.hpp"
#include "font.hpp"
#include "range.hpp"
#include "rect.hpp"
#include "settings.hpp"
#include "sides.hpp"

namespace plotlayout
{
struct chart_builder final
{
  drawing_area area;
  side_sizes margin{};
  side_sizes label_area_size{};
};

struct chart_areas final
{
  drawing_area plotting_area;
  // indexed by side; empty when the label area size is 0
  std::array<drawing_area, 4> label_areas;
};

// margins are taken off first, then the label areas; what is left is the plotting area
std::expected<chart_areas, drawing_error> split_chart_areas(const chart_builder &builder);

template <typename X, typename Y>
struct cartesian_2d final
{
  chart_areas areas;
  value_range<X> x_range;
  value_range<Y> y_range;

  const drawing_area &plotting_area() const { return areas.plotting_area; }
};

template <typename X, typename Y>
std::expected<cartesian_2d<X, Y>, drawing_error>
build_cartesian_2d(const chart_builder &builder, value_range<X> x_range, value_range<Y> y_range)
{
  auto areas = split_chart_areas(builder);
  if (!areas)
  {
    return std::unexpected(std::move(areas.error()));
  }
  return cartesian_2d<X, Y>{
      .areas = std::move(areas.value()), .x_range = x_range, .y_range = y_range};
}

// values far outside the range saturate here, leaving room to add an area offset
inline constexpr int pixel_saturation = std::numeric_limits<int>::max() / 2;

// pixel position of value v along [0, length - 1]; NaN maps to 0
int map_to_pixel(double v, double start, double end, std::uint32_t length);

// absolute backend coordinates; y.start is on the bottom row
template <typename X, typename Y>
glm::ivec2 translate(const cartesian_2d<X, Y> &cs, X x, Y y)
{
  const auto &r = cs.plotting_area().rect;
  const auto d = dims(r);
  return {r.lower_bounds.x
              + map_to_pixel(static_cast<double>(x), static_cast<double>(cs.x_range.start),
                             static_cast<double>(cs.x_range.end), d.x),
          r.upper_bounds.y - 1
              - map_to_pixel(static_cast<double>(y), static_cast<double>(cs.y_range.start),
                             static_cast<double>(cs.y_range.end), d.y)};
}

struct mesh_style final
{
  text_style label_style;
  glm::vec4 axis_color = plotlayout::axis_color;
  std::uint32_t tick_size = 5;
};

struct tick final
{
  int pixel;
  std::string label;
};

std::vector<tick> make_ticks(double start, double end, std::uint32_t length);

std::expected<void, drawing_error> draw_mesh(const chart_areas &areas,
                                             std::span<const tick> x_ticks,
                                             std::span<const tick> y_ticks,
                                             const mesh_style &style);

// axis lines on the left and bottom edge of the plotting area, ticks and their labels
template <typename X, typename Y>
std::expected<void, drawing_error> draw_mesh(const cartesian_2d<X, Y> &cs,
                                             const mesh_style &style)
{
  const auto d = dim_in_pixel(cs.plotting_area());
  const auto x_ticks = make_ticks(static_cast<double>(cs.x_range.start),
                                  static_cast<double>(cs.x_range.end), d.x);
  const auto y_ticks = make_ticks(static_cast<double>(cs.y_range.start),
                                  static_cast<double>(cs.y_range.end), d.y);
  return draw_mesh(cs.areas, x_ticks, y_ticks, style);
}
} // namespace plotlayout
