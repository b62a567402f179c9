#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <glm/vec2.hpp>
#include <glm/vec4.hpp>
#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_GLYPH_H
#include "colors.hpp"
#include "errors.hpp"

namespace plotlayout
{
struct font_desc final
{
  // fontconfig pattern such as "sans-serif" or "DejaVu Sans:bold"; empty means
  // settings::font_family()
  std::string family;
  std::uint32_t size = 12;
  // loaded directly, without fontconfig, when not empty
  std::filesystem::path file;

  bool operator==(const font_desc &other) const = default;
};

enum class h_pos
{
  left,
  center,
  right
};

enum class v_pos
{
  top,
  center,
  bottom
};

struct text_anchor final
{
  h_pos h = h_pos::left;
  v_pos v = v_pos::top;

  bool operator==(const text_anchor &other) const = default;
};

struct text_style final
{
  font_desc font;
  glm::vec4 color = text_color;
  text_anchor anchor;

  bool operator==(const text_style &other) const = default;
};

text_style with_anchor(text_style style, text_anchor anchor);

using ft_library = std::remove_pointer_t<FT_Library>;
using ft_font = std::remove_pointer_t<FT_Face>;
using ft_glyph = std::remove_pointer_t<FT_Glyph>;
using freetype_handle = std::unique_ptr<ft_library, FT_Error (*)(FT_Library)>;
using font_handle = std::unique_ptr<ft_font, FT_Error (*)(FT_Face)>;
using glyph_handle = std::unique_ptr<ft_glyph, void (*)(FT_Glyph)>;

// face is declared after ft so that it is released first
struct font_face final
{
  freetype_handle ft;
  font_handle face;
};

std::expected<font_face, font_error> load_font(const font_desc &font);

// ink bounds of a laid out string, y grows downwards and the origin sits on the baseline
struct text_box final
{
  glm::ivec2 lower_bounds;
  glm::ivec2 upper_bounds;
};

std::expected<text_box, font_error> layout_box(const font_face &face, std::string_view text);
std::expected<text_box, font_error> layout_box(std::string_view text, const font_desc &font);
std::expected<glm::uvec2, font_error> estimate_text_size(std::string_view text,
                                                         const font_desc &font);

// called once per covered pixel with its coverage in [0, 255]
using glyph_plotter = std::function<void(glm::ivec2, std::uint8_t)>;

// origin is the baseline start of the string
std::expected<void, font_error> render_text(const font_face &face, std::string_view text,
                                            glm::ivec2 origin, const glyph_plotter &plot);
} // namespace plotlayout
