#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <fmt/format.h>

namespace plotlayout
{
enum class font_error_kind
{
  invalid_size,
  library_init_failed,
  font_not_found,
  face_load_failed,
  size_not_supported,
  glyph_load_failed,
  invalid_utf8
};

struct font_error final
{
  font_error_kind kind;
  std::string detail;
};

enum class drawing_error_kind
{
  buffer_too_small,
  area_too_small,
  font,
  io
};

struct drawing_error final
{
  drawing_error_kind kind;
  std::string detail;
};

// reserved bands do not fit into the main area
enum class layout_error_kind
{
  too_narrow,
  too_short
};

struct layout_error final
{
  layout_error_kind kind;
  std::uint32_t available;
  std::uint64_t required;
};

std::string_view to_string(font_error_kind kind);
std::string_view to_string(drawing_error_kind kind);
std::string_view to_string(layout_error_kind kind);

drawing_error from_font_error(const font_error &e);
} // namespace plotlayout

template <>
struct fmt::formatter<plotlayout::font_error> : fmt::formatter<std::string_view>
{
  auto format(const plotlayout::font_error &e, fmt::format_context &ctx) const
  {
    return fmt::format_to(ctx.out(), "font error ({}): {}", plotlayout::to_string(e.kind),
                          e.detail);
  }
};

template <>
struct fmt::formatter<plotlayout::drawing_error> : fmt::formatter<std::string_view>
{
  auto format(const plotlayout::drawing_error &e, fmt::format_context &ctx) const
  {
    return fmt::format_to(ctx.out(), "drawing error ({}): {}", plotlayout::to_string(e.kind),
                          e.detail);
  }
};

template <>
struct fmt::formatter<plotlayout::layout_error> : fmt::formatter<std::string_view>
{
  auto format(const plotlayout::layout_error &e, fmt::format_context &ctx) const
  {
    return fmt::format_to(ctx.out(), "layout error ({}): {} pixels available, {} reserved",
                          plotlayout::to_string(e.kind), e.available, e.required);
  }
};
