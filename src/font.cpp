#include "font.hpp"
#include <algorithm>
#include <cstddef>
#include <limits>
#include <vector>
#include <fmt/format.h>
#include <fontconfig/fontconfig.h>
#include "settings.hpp"

namespace
{
using namespace plotlayout;

template <typename T, typename F>
auto with_free(T *ptr, F f)
{
  return std::unique_ptr<T, F>(ptr, f);
}

auto fail(font_error_kind kind, std::string detail)
{
  return std::unexpected(font_error{.kind = kind, .detail = std::move(detail)});
}

std::expected<std::string, font_error> resolve_font_file(const std::string &family)
{
  if (FcInit() == FcFalse)
  {
    return fail(font_error_kind::library_init_failed, "fontconfig initialization failed");
  }
  const auto &name = family.empty() ? settings::font_family() : family;
  auto pat = with_free(FcNameParse(reinterpret_cast<const FcChar8 *>(name.c_str())),
                       FcPatternDestroy);
  if (!pat)
  {
    return fail(font_error_kind::font_not_found, fmt::format("invalid font pattern '{}'", name));
  }
  if (FcConfigSubstitute(nullptr, pat.get(), FcMatchPattern) == FcFalse)
  {
    return fail(font_error_kind::library_init_failed, "fontconfig substitution failed");
  }
  FcDefaultSubstitute(pat.get());
  auto result = FcResultNoMatch;
  auto match = with_free(FcFontMatch(nullptr, pat.get(), &result), FcPatternDestroy);
  if (!match || result != FcResultMatch)
  {
    return fail(font_error_kind::font_not_found, fmt::format("no font matches '{}'", name));
  }
  FcChar8 *file = nullptr;
  if (FcPatternGetString(match.get(), FC_FILE, 0, &file) != FcResultMatch || file == nullptr)
  {
    return fail(font_error_kind::font_not_found, fmt::format("no font file for '{}'", name));
  }
  return std::string(reinterpret_cast<const char *>(file));
}

auto invalid_utf8(std::size_t offset)
{
  return fail(font_error_kind::invalid_utf8,
              fmt::format("invalid UTF-8 sequence at byte {}", offset));
}

// overlong forms, surrogates and truncated sequences are rejected
std::expected<std::vector<char32_t>, font_error> decode_utf8(std::string_view text)
{
  constexpr char32_t min_code_point[] = {0, 0, 0x80, 0x800, 0x10000};
  auto result = std::vector<char32_t>();
  result.reserve(text.size());
  for (auto i = std::size_t{0}; i < text.size();)
  {
    const auto lead = static_cast<unsigned char>(text[i]);
    auto len = std::size_t{0};
    auto code = char32_t{0};
    if ((lead & 0x80) == 0)
    {
      len = 1;
      code = lead;
    }
    else if ((lead & 0xe0) == 0xc0)
    {
      len = 2;
      code = lead & 0x1f;
    }
    else if ((lead & 0xf0) == 0xe0)
    {
      len = 3;
      code = lead & 0x0f;
    }
    else if ((lead & 0xf8) == 0xf0)
    {
      len = 4;
      code = lead & 0x07;
    }
    else
    {
      return invalid_utf8(i);
    }
    if (len > text.size() - i)
    {
      return invalid_utf8(i);
    }
    for (auto k = std::size_t{1}; k < len; ++k)
    {
      const auto next = static_cast<unsigned char>(text[i + k]);
      if ((next & 0xc0) != 0x80)
      {
        return invalid_utf8(i);
      }
      code = (code << 6) | (next & 0x3f);
    }
    if (code < min_code_point[len] || code > 0x10ffff || (code >= 0xd800 && code <= 0xdfff))
    {
      return invalid_utf8(i);
    }
    result.push_back(code);
    i += len;
  }
  return result;
}

struct placed_glyph final
{
  FT_UInt index;
  long pen_x;
};

// pen positions along the baseline with kerning applied
std::expected<std::vector<placed_glyph>, font_error> place_glyphs(FT_Face face,
                                                                  std::string_view text)
{
  const auto code_points = decode_utf8(text);
  if (!code_points)
  {
    return std::unexpected(code_points.error());
  }
  auto result = std::vector<placed_glyph>();
  result.reserve(code_points->size());
  auto pen_x = 0L;
  auto previous = FT_UInt{0};
  const auto has_kerning = FT_HAS_KERNING(face);
  for (const auto c : code_points.value())
  {
    const auto glyph_index = FT_Get_Char_Index(face, FT_ULong(c));
    if (has_kerning && previous != 0 && glyph_index != 0)
    {
      FT_Vector kerning = {0, 0};
      if (FT_Get_Kerning(face, previous, glyph_index, FT_KERNING_DEFAULT, &kerning) == 0)
      {
        pen_x += kerning.x >> 6;
      }
    }
    if (const auto error = FT_Load_Glyph(face, glyph_index, FT_LOAD_DEFAULT); error != 0)
    {
      return fail(font_error_kind::glyph_load_failed,
                  fmt::format("cannot load glyph for U+{:04X} (FreeType error {})",
                              static_cast<std::uint32_t>(c), error));
    }
    result.push_back({.index = glyph_index, .pen_x = pen_x});
    pen_x += face->glyph->advance.x >> 6;
    previous = glyph_index;
  }
  return result;
}
} // namespace

namespace plotlayout
{
text_style with_anchor(text_style style, text_anchor anchor)
{
  style.anchor = anchor;
  return style;
}

std::expected<font_face, font_error> load_font(const font_desc &font)
{
  if (font.size == 0)
  {
    return fail(font_error_kind::invalid_size, "font size must be positive");
  }
  auto path = font.file.string();
  if (path.empty())
  {
    auto resolved = resolve_font_file(font.family);
    if (!resolved)
    {
      return std::unexpected(std::move(resolved.error()));
    }
    path = std::move(resolved.value());
  }

  FT_Library lib = nullptr;
  if (const auto error = FT_Init_FreeType(&lib); error != 0)
  {
    return fail(font_error_kind::library_init_failed,
                fmt::format("FreeType initialization failed (error {})", error));
  }
  auto ft = freetype_handle(lib, FT_Done_FreeType);

  FT_Face face = nullptr;
  if (const auto error = FT_New_Face(lib, path.c_str(), 0, &face); error != 0)
  {
    return fail(font_error_kind::face_load_failed,
                fmt::format("cannot open '{}' (FreeType error {})", path, error));
  }
  auto handle = font_handle(face, FT_Done_Face);

  const auto dpi = settings::font_dpi();
  if (const auto error =
          FT_Set_Char_Size(face, 0, static_cast<FT_F26Dot6>(font.size) << 6, dpi, dpi);
      error != 0)
  {
    return fail(font_error_kind::size_not_supported,
                fmt::format("'{}' has no size {} (FreeType error {})", path, font.size, error));
  }
  return font_face{.ft = std::move(ft), .face = std::move(handle)};
}

std::expected<text_box, font_error> layout_box(const font_face &font, std::string_view text)
{
  auto *face = font.face.get();
  auto glyphs = place_glyphs(face, text);
  if (!glyphs)
  {
    return std::unexpected(std::move(glyphs.error()));
  }

  auto lower = glm::ivec2(std::numeric_limits<int>::max());
  auto upper = glm::ivec2(std::numeric_limits<int>::lowest());
  auto inked = false;
  for (const auto &placed : glyphs.value())
  {
    if (const auto error = FT_Load_Glyph(face, placed.index, FT_LOAD_DEFAULT); error != 0)
    {
      return fail(font_error_kind::glyph_load_failed,
                  fmt::format("cannot load glyph {} (FreeType error {})", placed.index, error));
    }
    FT_Glyph g = nullptr;
    if (const auto error = FT_Get_Glyph(face->glyph, &g); error != 0)
    {
      return fail(font_error_kind::glyph_load_failed,
                  fmt::format("cannot copy glyph {} (FreeType error {})", placed.index, error));
    }
    auto glyph = glyph_handle(g, FT_Done_Glyph);
    auto box = FT_BBox{};
    FT_Glyph_Get_CBox(glyph.get(), FT_GLYPH_BBOX_PIXELS, &box);
    if (box.xMax <= box.xMin || box.yMax <= box.yMin)
    {
      continue;
    }
    inked = true;
    const auto x = static_cast<int>(placed.pen_x);
    lower = glm::min(lower, glm::ivec2(x + box.xMin, -box.yMax));
    upper = glm::max(upper, glm::ivec2(x + box.xMax, -box.yMin));
  }
  if (!inked)
  {
    // blank text still advances the pen but has no height
    const auto width = glyphs.value().empty()
                           ? 0
                           : static_cast<int>(glyphs.value().back().pen_x
                                              + (face->glyph->advance.x >> 6));
    return text_box{.lower_bounds = {0, 0}, .upper_bounds = {width, 0}};
  }
  return text_box{.lower_bounds = lower, .upper_bounds = upper};
}

std::expected<text_box, font_error> layout_box(std::string_view text, const font_desc &font)
{
  auto face = load_font(font);
  if (!face)
  {
    return std::unexpected(std::move(face.error()));
  }
  return layout_box(face.value(), text);
}

std::expected<glm::uvec2, font_error> estimate_text_size(std::string_view text,
                                                         const font_desc &font)
{
  const auto box = layout_box(text, font);
  if (!box)
  {
    return std::unexpected(box.error());
  }
  return glm::uvec2(box->upper_bounds - box->lower_bounds);
}

std::expected<void, font_error> render_text(const font_face &font, std::string_view text,
                                            glm::ivec2 origin, const glyph_plotter &plot)
{
  auto *face = font.face.get();
  auto glyphs = place_glyphs(face, text);
  if (!glyphs)
  {
    return std::unexpected(std::move(glyphs.error()));
  }
  for (const auto &placed : glyphs.value())
  {
    if (const auto error = FT_Load_Glyph(face, placed.index, FT_LOAD_RENDER); error != 0)
    {
      return fail(font_error_kind::glyph_load_failed,
                  fmt::format("cannot render glyph {} (FreeType error {})", placed.index, error));
    }
    const auto &slot = *face->glyph;
    const auto &bitmap = slot.bitmap;
    const auto left = origin.x + static_cast<int>(placed.pen_x) + slot.bitmap_left;
    const auto top = origin.y - slot.bitmap_top;
    const auto mono = bitmap.pixel_mode == FT_PIXEL_MODE_MONO;
    for (auto row = 0u; row < bitmap.rows; ++row)
    {
      const auto *line = bitmap.buffer + static_cast<long>(row) * bitmap.pitch;
      for (auto col = 0u; col < bitmap.width; ++col)
      {
        const auto coverage = mono ? ((line[col >> 3] >> (7 - (col & 7))) & 1 ? 255 : 0)
                                   : line[col];
        if (coverage != 0)
        {
          plot({left + static_cast<int>(col), top + static_cast<int>(row)},
               static_cast<std::uint8_t>(coverage));
        }
      }
    }
  }
  return {};
}
} // namespace plotlayout
