#include "errors.hpp"

namespace plotlayout
{
std::string_view to_string(font_error_kind kind)
{
  switch (kind)
  {
  case font_error_kind::invalid_size:
    return "invalid size";
  case font_error_kind::library_init_failed:
    return "library init failed";
  case font_error_kind::font_not_found:
    return "font not found";
  case font_error_kind::face_load_failed:
    return "face load failed";
  case font_error_kind::size_not_supported:
    return "size not supported";
  case font_error_kind::glyph_load_failed:
    return "glyph load failed";
  case font_error_kind::invalid_utf8:
    return "invalid utf-8";
  }
  return "";
}

std::string_view to_string(drawing_error_kind kind)
{
  switch (kind)
  {
  case drawing_error_kind::buffer_too_small:
    return "buffer too small";
  case drawing_error_kind::area_too_small:
    return "area too small";
  case drawing_error_kind::font:
    return "font";
  case drawing_error_kind::io:
    return "io";
  }
  return "";
}

std::string_view to_string(layout_error_kind kind)
{
  switch (kind)
  {
  case layout_error_kind::too_narrow:
    return "too narrow";
  case layout_error_kind::too_short:
    return "too short";
  }
  return "";
}

drawing_error from_font_error(const font_error &e)
{
  return {.kind = drawing_error_kind::font, .detail = fmt::format("{}", e)};
}
} // namespace plotlayout
