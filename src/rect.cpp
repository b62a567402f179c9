#include "rect.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace
{
auto resolution_for(int exp)
{
  auto result = 1.0;
  if (exp > 0)
  {
    for (int i = 0; i < exp; ++i)
    {
      result *= 10.0;
    }
  }
  else
  {
    for (int i = exp; i < 0; ++i)
    {
      result /= 10.0;
    }
  }
  return result;
}
} // namespace

namespace plotlayout
{
glm::uvec2 dims(const pixel_rect &r)
{
  const auto d = glm::max(r.upper_bounds - r.lower_bounds, glm::ivec2(0));
  return glm::uvec2(d);
}

bool contains(const pixel_rect &r, glm::ivec2 p)
{
  return p.x >= r.lower_bounds.x && p.y >= r.lower_bounds.y && p.x < r.upper_bounds.x
         && p.y < r.upper_bounds.y;
}

pixel_rect intersect(const pixel_rect &r1, const pixel_rect &r2)
{
  const auto lower = glm::max(r1.lower_bounds, r2.lower_bounds);
  return {.lower_bounds = lower,
          .upper_bounds = glm::max(glm::min(r1.upper_bounds, r2.upper_bounds), lower)};
}

std::pair<pixel_rect, pixel_rect> split_vertically(const pixel_rect &r, std::uint32_t y)
{
  const auto height = dims(r).y;
  const auto split = r.lower_bounds.y + static_cast<int>(std::min(y, height));
  return {pixel_rect{.lower_bounds = r.lower_bounds, .upper_bounds = {r.upper_bounds.x, split}},
          pixel_rect{.lower_bounds = {r.lower_bounds.x, split}, .upper_bounds = r.upper_bounds}};
}

pixel_rect inset(const pixel_rect &r, const side_sizes &sizes)
{
  return {.lower_bounds = r.lower_bounds
                          + glm::ivec2(at(sizes, side::left), at(sizes, side::top)),
          .upper_bounds = r.upper_bounds
                          - glm::ivec2(at(sizes, side::right), at(sizes, side::bottom))};
}

tick_interval round_to_ticks(double min, double max, int num_ticks, int digits)
{
  if (!(max > min) || num_ticks < 2)
  {
    return {.min = min, .max = max, .step = 0.0, .lsd = 0};
  }
  const auto num_splits = static_cast<double>(num_ticks - 1);
  const auto raw_interval = (max - min) / num_splits;
  const auto exp = static_cast<int>(std::ceil(std::log10(raw_interval))) - digits;
  const auto resolution = resolution_for(exp);
  const auto step = std::ceil(raw_interval / resolution - 1.e-9) * resolution;
  const auto start = std::ceil(min / step - 1.e-9) * step;
  const auto count = std::floor((max - start) / step + 1.e-9);
  return {.min = start, .max = start + count * step, .step = step, .lsd = exp};
}

std::string format_for_tic(double value, int lsd)
{
  if (lsd <= 0)
  {
    auto tolerance = 0.0001;
    for (int i = 0; i < -lsd; ++i)
    {
      tolerance /= 10.0;
    }
    value += std::copysign(tolerance, value);
  }
  return fmt::format("{:.{}f}", value, std::max(0, -lsd));
}

} // namespace plotlayout
