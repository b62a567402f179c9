#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <glm/vec2.hpp>
#include <fmt/format.h>
#include "coordinate_system_2d.hpp"
#include "drawing_area.hpp"
#include "errors.hpp"
#include "font.hpp"
#include "range.hpp"
#include "sides.hpp"

namespace plotlayout
{
class chart_layout_builder;

struct caption_content final
{
  std::string text;
  text_style style;
  // space above and below the text inside the title band
  std::uint32_t y_padding;

  bool operator==(const caption_content &other) const = default;
};

// Band sizes of a chart, known before any drawing area exists.
class chart_layout final
{
public:
  chart_layout() = default;

  chart_layout &set_all_label_area_size(std::uint32_t top, std::uint32_t bottom,
                                        std::uint32_t left, std::uint32_t right);
  chart_layout &x_label_area_size(std::uint32_t size);
  chart_layout &y_label_area_size(std::uint32_t size);
  chart_layout &top_x_label_area_size(std::uint32_t size);
  chart_layout &right_y_label_area_size(std::uint32_t size);

  chart_layout &set_all_margin(std::uint32_t top, std::uint32_t bottom, std::uint32_t left,
                               std::uint32_t right);
  chart_layout &margin(std::uint32_t size);
  chart_layout &margin_top(std::uint32_t size);
  chart_layout &margin_bottom(std::uint32_t size);
  chart_layout &margin_left(std::uint32_t size);
  chart_layout &margin_right(std::uint32_t size);

  // removes the caption together with its title band
  chart_layout &no_caption();

  // Sets the caption and sizes the title band from the text's measured height. Text
  // without ink has no height and clears the caption.
  std::expected<chart_layout *, font_error> caption(std::string text, const font_desc &font);

  // Swaps the caption text and keeps the title band measured for the previous text.
  // Call caption() to measure the new text. Does nothing without a caption.
  chart_layout &replace_caption(std::string text);

  // pixels taken by the title band, margins and label areas; each component saturates at
  // UINT32_MAX
  glm::uvec2 additional_sizes() const;

  // Size of a root area whose plotting area is plot_size. Components saturate at UINT32_MAX,
  // so a saturated result cannot hold plot_size and callers must bound plot_size themselves.
  glm::uvec2 desired_image_size(glm::uvec2 plot_size) const;

  // aspect_ratio is plotting area height / plotting area width; widths that cannot hold the
  // reserved bands yield additional_sizes().y
  std::uint32_t desired_image_height_from_width(std::uint32_t image_width,
                                                double aspect_ratio) const;

  // Draws the caption into the title band of root and keeps a copy of this layout.
  std::expected<chart_layout_builder, drawing_error> bind(const drawing_area &root) const;

  std::uint32_t title_height() const { return _title_height; }
  const std::optional<caption_content> &title_content() const { return _title_content; }
  const side_sizes &margins() const { return _margin; }
  const side_sizes &label_area_sizes() const { return _label_area_size; }

  bool operator==(const chart_layout &other) const = default;

private:
  std::uint32_t _title_height = 0;
  std::optional<caption_content> _title_content;
  side_sizes _margin{};
  side_sizes _label_area_size{};
};

// A chart_layout bound to the area left below its title band.
class chart_layout_builder final
{
public:
  chart_layout_builder(chart_layout layout, drawing_area main_area);

  std::expected<glm::uvec2, layout_error> estimate_plot_area_size() const;

  template <typename X, typename Y>
  std::expected<cartesian_2d<X, Y>, drawing_error> build_cartesian_2d(value_range<X> x_range,
                                                                      value_range<Y> y_range) const
  {
    return plotlayout::build_cartesian_2d(to_chart_builder(), x_range, y_range);
  }

  const chart_layout &layout() const { return _layout; }
  const drawing_area &main_area() const { return _main_area; }

private:
  chart_builder to_chart_builder() const;

  chart_layout _layout;
  drawing_area _main_area;
};
} // namespace plotlayout

template <>
struct fmt::formatter<plotlayout::chart_layout> : fmt::formatter<std::string_view>
{
  auto format(const plotlayout::chart_layout &l, fmt::format_context &ctx) const
  {
    const auto &m = l.margins();
    const auto &s = l.label_area_sizes();
    return fmt::format_to(
        ctx.out(),
        "chart_layout {{ title_height: {}, title_content: {}, margin: [{}, {}, {}, {}], "
        "label_area_size: [{}, {}, {}, {}] }}",
        l.title_height(), l.title_content() ? fmt::format("'{}'", l.title_content()->text) : "none",
        m[0], m[1], m[2], m[3], s[0], s[1], s[2], s[3]);
  }
};
