#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>
#include <fmt/format.h>
#include "chart_layout.hpp"
#include "colors.hpp"
#include "coordinate_system_2d.hpp"
#include "drawing_area.hpp"
#include "range.hpp"

namespace
{
using namespace plotlayout;

constexpr std::uint32_t max_plot_size = 16384;

std::optional<std::uint32_t> parse_size(std::string_view arg)
{
  auto value = std::uint32_t{0};
  const auto [end, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), value);
  if (ec != std::errc() || end != arg.data() + arg.size() || value == 0
      || value > max_plot_size)
  {
    return std::nullopt;
  }
  return value;
}

int usage()
{
  fmt::print("usage: plotlayout-demo OUTPUT.ppm [PLOT_WIDTH PLOT_HEIGHT] [CAPTION]\n");
  return EXIT_FAILURE;
}
} // namespace

int main(int argc, char **argv)
{
  const auto args = std::vector<std::string_view>(argv + 1, argv + argc);
  if (args.empty() || args.size() == 2 || args.size() > 4)
  {
    return usage();
  }
  auto plot_size = glm::uvec2(640, 400);
  if (args.size() >= 3)
  {
    const auto w = parse_size(args[1]);
    const auto h = parse_size(args[2]);
    if (!w || !h)
    {
      fmt::print("error: invalid plot size '{}x{}', each side must be 1..{}\n", args[1],
                 args[2], max_plot_size);
      return usage();
    }
    plot_size = {*w, *h};
  }
  const auto caption = args.size() == 4 ? std::string(args[3]) : std::string("Graph Title");

  auto layout = chart_layout();
  const auto captioned = layout.caption(caption, font_desc{.family = "sans-serif", .size = 40});
  if (!captioned)
  {
    fmt::print("error: {}\n", captioned.error());
    return EXIT_FAILURE;
  }
  layout.margin(4).x_label_area_size(40).y_label_area_size(40);

  const auto image_size = layout.desired_image_size(plot_size);
  fmt::print("{}\nimage size: {}x{}\n", layout, image_size.x, image_size.y);

  auto buffer = std::vector<std::uint8_t>(required_buffer_size(image_size));
  auto backend = make_bitmap_backend(buffer, image_size);
  if (!backend)
  {
    fmt::print("error: {}\n", backend.error());
    return EXIT_FAILURE;
  }
  auto root = into_drawing_area(backend.value());
  fill(root, background_color);

  const auto builder = layout.bind(root);
  if (!builder)
  {
    fmt::print("error: {}\n", builder.error());
    return EXIT_FAILURE;
  }
  const auto estimated = builder->estimate_plot_area_size();
  if (!estimated)
  {
    fmt::print("error: {}\n", estimated.error());
    return EXIT_FAILURE;
  }

  const auto minimum = std::pair{value_range{-200.0, 200.0}, value_range{-100.0, 100.0}};
  const auto [x_range, y_range] = centering_ranges(
      minimum, std::pair{static_cast<double>(estimated->x), static_cast<double>(estimated->y)});
  fmt::print("plot area: {}x{}, x range: {}..{}, y range: {}..{}\n", estimated->x, estimated->y,
             x_range.start, x_range.end, y_range.start, y_range.end);

  const auto chart = builder->build_cartesian_2d(x_range, y_range);
  if (!chart)
  {
    fmt::print("error: {}\n", chart.error());
    return EXIT_FAILURE;
  }
  if (auto drawn = draw_mesh(chart.value(), mesh_style{}); !drawn)
  {
    fmt::print("error: {}\n", drawn.error());
    return EXIT_FAILURE;
  }
  if (auto written = write_ppm(backend.value(), std::string(args[0])); !written)
  {
    fmt::print("error: {}\n", written.error());
    return EXIT_FAILURE;
  }
  fmt::print("wrote {}\n", args[0]);
  return EXIT_SUCCESS;
}
