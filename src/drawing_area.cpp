#include "drawing_area.hpp"

namespace
{
using namespace plotlayout;

// offset from the anchor point to the baseline origin of the text
glm::ivec2 anchor_offset(const text_box &box, text_anchor anchor)
{
  auto offset = glm::ivec2(0);
  switch (anchor.h)
  {
  case h_pos::left:
    offset.x = -box.lower_bounds.x;
    break;
  case h_pos::center:
    offset.x = -(box.lower_bounds.x + box.upper_bounds.x) / 2;
    break;
  case h_pos::right:
    offset.x = -box.upper_bounds.x;
    break;
  }
  switch (anchor.v)
  {
  case v_pos::top:
    offset.y = -box.lower_bounds.y;
    break;
  case v_pos::center:
    offset.y = -(box.lower_bounds.y + box.upper_bounds.y) / 2;
    break;
  case v_pos::bottom:
    offset.y = -box.upper_bounds.y;
    break;
  }
  return offset;
}
} // namespace

namespace plotlayout
{
drawing_area into_drawing_area(bitmap_backend &backend)
{
  return {.backend = &backend,
          .rect = {.lower_bounds = {0, 0}, .upper_bounds = glm::ivec2(backend.size)}};
}

drawing_area sub_area(const drawing_area &area, const pixel_rect &absolute)
{
  return {.backend = area.backend, .rect = intersect(area.rect, absolute)};
}

glm::uvec2 dim_in_pixel(const drawing_area &area) { return dims(area.rect); }

std::pair<drawing_area, drawing_area> split_vertically(const drawing_area &area, std::uint32_t y)
{
  const auto [upper, lower] = split_vertically(area.rect, y);
  return {drawing_area{.backend = area.backend, .rect = upper},
          drawing_area{.backend = area.backend, .rect = lower}};
}

void fill(const drawing_area &area, const glm::vec4 &color)
{
  draw_rect(area, {0, 0}, glm::ivec2(dim_in_pixel(area)), color, true);
}

void draw_rect(const drawing_area &area, glm::ivec2 lower, glm::ivec2 upper,
               const glm::vec4 &color, bool filled)
{
  const auto r = intersect(area.rect, pixel_rect{.lower_bounds = area.rect.lower_bounds + lower,
                                                 .upper_bounds = area.rect.lower_bounds + upper});
  const auto outline = pixel_rect{.lower_bounds = area.rect.lower_bounds + lower,
                                  .upper_bounds = area.rect.lower_bounds + upper - 1};
  for (auto y = r.lower_bounds.y; y < r.upper_bounds.y; ++y)
  {
    for (auto x = r.lower_bounds.x; x < r.upper_bounds.x; ++x)
    {
      if (filled || x == outline.lower_bounds.x || x == outline.upper_bounds.x
          || y == outline.lower_bounds.y || y == outline.upper_bounds.y)
      {
        blend_pixel(*area.backend, {x, y}, color);
      }
    }
  }
}

std::expected<void, drawing_error> draw_text(const drawing_area &area, std::string_view text,
                                             const text_style &style, glm::ivec2 pos)
{
  const auto face = load_font(style.font);
  if (!face)
  {
    return std::unexpected(from_font_error(face.error()));
  }
  const auto box = layout_box(face.value(), text);
  if (!box)
  {
    return std::unexpected(from_font_error(box.error()));
  }
  const auto origin = area.rect.lower_bounds + pos + anchor_offset(box.value(), style.anchor);
  const auto rendered = render_text(face.value(), text, origin,
                                    [&](glm::ivec2 p, std::uint8_t coverage)
                                    {
                                      if (contains(area.rect, p))
                                      {
                                        blend_pixel(*area.backend, p, style.color,
                                                    static_cast<float>(coverage) / 255.0f);
                                      }
                                    });
  if (!rendered)
  {
    return std::unexpected(from_font_error(rendered.error()));
  }
  return {};
}
} // namespace plotlayout
