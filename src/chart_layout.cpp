#include "chart_layout.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace
{
std::uint32_t saturate(std::uint64_t value)
{
  return static_cast<std::uint32_t>(
      std::min<std::uint64_t>(value, std::numeric_limits<std::uint32_t>::max()));
}
} // namespace

namespace plotlayout
{
chart_layout &chart_layout::set_all_label_area_size(std::uint32_t top, std::uint32_t bottom,
                                                    std::uint32_t left, std::uint32_t right)
{
  _label_area_size = {top, bottom, left, right};
  return *this;
}

chart_layout &chart_layout::x_label_area_size(std::uint32_t size)
{
  at(_label_area_size, side::bottom) = size;
  return *this;
}

chart_layout &chart_layout::y_label_area_size(std::uint32_t size)
{
  at(_label_area_size, side::left) = size;
  return *this;
}

chart_layout &chart_layout::top_x_label_area_size(std::uint32_t size)
{
  at(_label_area_size, side::top) = size;
  return *this;
}

chart_layout &chart_layout::right_y_label_area_size(std::uint32_t size)
{
  at(_label_area_size, side::right) = size;
  return *this;
}

chart_layout &chart_layout::set_all_margin(std::uint32_t top, std::uint32_t bottom,
                                           std::uint32_t left, std::uint32_t right)
{
  _margin = {top, bottom, left, right};
  return *this;
}

chart_layout &chart_layout::margin(std::uint32_t size)
{
  _margin = {size, size, size, size};
  return *this;
}

chart_layout &chart_layout::margin_top(std::uint32_t size)
{
  at(_margin, side::top) = size;
  return *this;
}

chart_layout &chart_layout::margin_bottom(std::uint32_t size)
{
  at(_margin, side::bottom) = size;
  return *this;
}

chart_layout &chart_layout::margin_left(std::uint32_t size)
{
  at(_margin, side::left) = size;
  return *this;
}

chart_layout &chart_layout::margin_right(std::uint32_t size)
{
  at(_margin, side::right) = size;
  return *this;
}

chart_layout &chart_layout::no_caption()
{
  _title_height = 0;
  _title_content.reset();
  return *this;
}

std::expected<chart_layout *, font_error> chart_layout::caption(std::string text,
                                                                const font_desc &font)
{
  const auto size = estimate_text_size(text, font);
  if (!size)
  {
    return std::unexpected(size.error());
  }
  const auto text_h = size->y;
  if (text_h == 0)
  {
    no_caption();
    return this;
  }
  const auto y_padding = std::min(text_h / 2, 5u);
  _title_height = y_padding * 2 + text_h;
  _title_content = caption_content{
      .text = std::move(text), .style = text_style{.font = font, .color = caption_color},
      .y_padding = y_padding};
  return this;
}

chart_layout &chart_layout::replace_caption(std::string text)
{
  if (_title_content)
  {
    _title_content->text = std::move(text);
  }
  return *this;
}

glm::uvec2 chart_layout::additional_sizes() const
{
  const auto width = horizontal_sum(_margin) + horizontal_sum(_label_area_size);
  const auto height =
      std::uint64_t{_title_height} + vertical_sum(_margin) + vertical_sum(_label_area_size);
  return {saturate(width), saturate(height)};
}

glm::uvec2 chart_layout::desired_image_size(glm::uvec2 plot_size) const
{
  const auto additional = additional_sizes();
  return {saturate(std::uint64_t{plot_size.x} + additional.x),
          saturate(std::uint64_t{plot_size.y} + additional.y)};
}

std::uint32_t chart_layout::desired_image_height_from_width(std::uint32_t image_width,
                                                            double aspect_ratio) const
{
  const auto additional = additional_sizes();
  if (image_width < additional.x)
  {
    return additional.y;
  }
  const auto plot_height =
      std::floor(static_cast<double>(image_width - additional.x) * aspect_ratio);
  const auto limit =
      static_cast<double>(std::numeric_limits<std::uint32_t>::max() - additional.y);
  // negative and NaN heights saturate to 0
  const auto clamped = plot_height >= 0.0 ? std::min(plot_height, limit) : 0.0;
  return static_cast<std::uint32_t>(clamped) + additional.y;
}

std::expected<chart_layout_builder, drawing_error>
chart_layout::bind(const drawing_area &root) const
{
  if (_title_height == 0)
  {
    return chart_layout_builder(*this, root);
  }
  const auto [title_area, main_area] = split_vertically(root, _title_height);
  if (_title_content)
  {
    const auto x_padding = dim_in_pixel(title_area).x / 2;
    const auto style =
        with_anchor(_title_content->style, {.h = h_pos::center, .v = v_pos::top});
    const auto drawn =
        draw_text(title_area, _title_content->text, style,
                  {static_cast<int>(x_padding), static_cast<int>(_title_content->y_padding)});
    if (!drawn)
    {
      return std::unexpected(drawn.error());
    }
  }
  return chart_layout_builder(*this, main_area);
}

chart_layout_builder::chart_layout_builder(chart_layout layout, drawing_area main_area)
    : _layout(std::move(layout)), _main_area(main_area)
{
}

std::expected<glm::uvec2, layout_error> chart_layout_builder::estimate_plot_area_size() const
{
  const auto &m = _layout.margins();
  const auto &l = _layout.label_area_sizes();
  // main area does not include the title band
  const auto image = dim_in_pixel(_main_area);
  const auto reserved_x = horizontal_sum(m) + horizontal_sum(l);
  const auto reserved_y = vertical_sum(m) + vertical_sum(l);
  if (reserved_x > image.x)
  {
    return std::unexpected(layout_error{
        .kind = layout_error_kind::too_narrow, .available = image.x, .required = reserved_x});
  }
  if (reserved_y > image.y)
  {
    return std::unexpected(layout_error{
        .kind = layout_error_kind::too_short, .available = image.y, .required = reserved_y});
  }
  return glm::uvec2(image.x - static_cast<std::uint32_t>(reserved_x),
                    image.y - static_cast<std::uint32_t>(reserved_y));
}

chart_builder chart_layout_builder::to_chart_builder() const
{
  return {.area = _main_area,
          .margin = _layout.margins(),
          .label_area_size = _layout.label_area_sizes()};
}
} // namespace plotlayout
