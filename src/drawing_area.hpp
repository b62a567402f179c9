#pragma once

#include <cstdint>
#include <expected>
#include <string_view>
#include <utility>
#include <glm/vec2.hpp>
#include <glm/vec4.hpp>
#include "bitmap_backend.hpp"
#include "errors.hpp"
#include "font.hpp"
#include "rect.hpp"

namespace plotlayout
{
// Non-owning view of a rectangle of a backend. Coordinates passed to the drawing
// functions are relative to the top left corner of the area and drawing is clipped to it.
// The backend must outlive every area made from it.
struct drawing_area final
{
  bitmap_backend *backend;
  pixel_rect rect;
};

drawing_area into_drawing_area(bitmap_backend &backend);
// absolute is clipped to area
drawing_area sub_area(const drawing_area &area, const pixel_rect &absolute);

glm::uvec2 dim_in_pixel(const drawing_area &area);
std::pair<drawing_area, drawing_area> split_vertically(const drawing_area &area, std::uint32_t y);

void fill(const drawing_area &area, const glm::vec4 &color);
// upper is exclusive
void draw_rect(const drawing_area &area, glm::ivec2 lower, glm::ivec2 upper,
               const glm::vec4 &color, bool filled);
std::expected<void, drawing_error> draw_text(const drawing_area &area, std::string_view text,
                                             const text_style &style, glm::ivec2 pos);
} // namespace plotlayout
