#pragma once

#include <glm/vec2.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include "sides.hpp"

namespace plotlayout
{
// pixel rectangle, lower_bounds inclusive, upper_bounds exclusive, y grows downwards
struct pixel_rect
{
  glm::ivec2 lower_bounds;
  glm::ivec2 upper_bounds;

  bool operator==(const pixel_rect &other) const = default;
};

glm::uvec2 dims(const pixel_rect &r);
bool contains(const pixel_rect &r, glm::ivec2 p);
pixel_rect intersect(const pixel_rect &r1, const pixel_rect &r2);

// rows [0, y) go to the first rect, the rest to the second; y is clamped to the height
std::pair<pixel_rect, pixel_rect> split_vertically(const pixel_rect &r, std::uint32_t y);

// the caller guarantees the insets fit into r
pixel_rect inset(const pixel_rect &r, const side_sizes &sizes);

// ticks start at min and repeat every step up to max, all inside the rounded range
struct tick_interval final
{
  double min;
  double max;
  double step;
  int lsd;
};

tick_interval round_to_ticks(double min, double max, int num_ticks, int digits);
std::string format_for_tic(double value, int lsd);
} // namespace plotlayout
