#include "coordinate_system_2d.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <fmt/format.h>

namespace
{
using namespace plotlayout;

bool is_empty(const drawing_area &area)
{
  const auto d = dim_in_pixel(area);
  return d.x == 0 || d.y == 0;
}

drawing_area make_area(const drawing_area &parent, glm::ivec2 lower, glm::ivec2 upper)
{
  return sub_area(parent, {.lower_bounds = lower, .upper_bounds = upper});
}
} // namespace

namespace plotlayout
{
std::expected<chart_areas, drawing_error> split_chart_areas(const chart_builder &builder)
{
  const auto d = dim_in_pixel(builder.area);
  const auto reserved_x = horizontal_sum(builder.margin) + horizontal_sum(builder.label_area_size);
  const auto reserved_y = vertical_sum(builder.margin) + vertical_sum(builder.label_area_size);
  if (reserved_x > d.x || reserved_y > d.y)
  {
    return std::unexpected(drawing_error{
        .kind = drawing_error_kind::area_too_small,
        .detail = fmt::format("{}x{} pixels cannot hold {}x{} pixels of margins and labels", d.x,
                              d.y, reserved_x, reserved_y)});
  }
  const auto inner = inset(builder.area.rect, builder.margin);
  const auto plot = inset(inner, builder.label_area_size);
  const auto &parent = builder.area;

  auto areas = chart_areas{.plotting_area = make_area(parent, plot.lower_bounds, plot.upper_bounds),
                           .label_areas = {}};
  areas.label_areas[index(side::top)] =
      make_area(parent, {plot.lower_bounds.x, inner.lower_bounds.y},
                {plot.upper_bounds.x, plot.lower_bounds.y});
  areas.label_areas[index(side::bottom)] =
      make_area(parent, {plot.lower_bounds.x, plot.upper_bounds.y},
                {plot.upper_bounds.x, inner.upper_bounds.y});
  areas.label_areas[index(side::left)] =
      make_area(parent, {inner.lower_bounds.x, plot.lower_bounds.y},
                {plot.lower_bounds.x, plot.upper_bounds.y});
  areas.label_areas[index(side::right)] =
      make_area(parent, {plot.upper_bounds.x, plot.lower_bounds.y},
                {inner.upper_bounds.x, plot.upper_bounds.y});
  return areas;
}

int map_to_pixel(double v, double start, double end, std::uint32_t length)
{
  if (length == 0 || end == start)
  {
    return 0;
  }
  const auto last = static_cast<double>(length - 1);
  const auto pixel = std::round((v - start) / (end - start) * last);
  if (std::isnan(pixel))
  {
    return 0;
  }
  return static_cast<int>(std::clamp(pixel, -static_cast<double>(pixel_saturation),
                                     static_cast<double>(pixel_saturation)));
}

std::vector<tick> make_ticks(double start, double end, std::uint32_t length)
{
  auto ticks = std::vector<tick>();
  const auto lo = std::min(start, end);
  const auto hi = std::max(start, end);
  const auto interval = round_to_ticks(lo, hi, static_cast<int>(settings::tick_count()),
                                       static_cast<int>(settings::tick_digits()));
  if (!(interval.step > 0.0) || length == 0)
  {
    return ticks;
  }
  const auto count = static_cast<int>(std::round((interval.max - interval.min) / interval.step));
  ticks.reserve(static_cast<std::size_t>(count) + 1);
  for (auto i = 0; i <= count; ++i)
  {
    const auto value = interval.min + static_cast<double>(i) * interval.step;
    ticks.push_back({.pixel = map_to_pixel(value, start, end, length),
                     .label = format_for_tic(value, interval.lsd)});
  }
  return ticks;
}

std::expected<void, drawing_error> draw_mesh(const chart_areas &areas,
                                             std::span<const tick> x_ticks,
                                             std::span<const tick> y_ticks,
                                             const mesh_style &style)
{
  const auto &plot = areas.plotting_area;
  if (is_empty(plot))
  {
    return {};
  }
  const auto d = glm::ivec2(dim_in_pixel(plot));
  const auto tick_size = static_cast<int>(style.tick_size);
  draw_rect(plot, {0, 0}, {1, d.y}, style.axis_color, true);
  draw_rect(plot, {0, d.y - 1}, {d.x, d.y}, style.axis_color, true);

  const auto &bottom = areas.label_areas[index(side::bottom)];
  if (!is_empty(bottom))
  {
    const auto x_style = with_anchor(style.label_style, {.h = h_pos::center, .v = v_pos::top});
    for (const auto &t : x_ticks)
    {
      draw_rect(bottom, {t.pixel, 0}, {t.pixel + 1, tick_size}, style.axis_color, true);
      if (auto drawn = draw_text(bottom, t.label, x_style, {t.pixel, tick_size + 2}); !drawn)
      {
        return drawn;
      }
    }
  }

  const auto &left = areas.label_areas[index(side::left)];
  if (!is_empty(left))
  {
    const auto width = static_cast<int>(dim_in_pixel(left).x);
    const auto y_style = with_anchor(style.label_style, {.h = h_pos::right, .v = v_pos::center});
    for (const auto &t : y_ticks)
    {
      const auto row = d.y - 1 - t.pixel;
      draw_rect(left, {width - tick_size, row}, {width, row + 1}, style.axis_color, true);
      if (auto drawn = draw_text(left, t.label, y_style, {width - tick_size - 2, row}); !drawn)
      {
        return drawn;
      }
    }
  }
  return {};
}
} // namespace plotlayout
