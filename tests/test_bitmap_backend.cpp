#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>
#include "bitmap_backend.hpp"
#include "colors.hpp"
#include "drawing_area.hpp"

using namespace plotlayout;

namespace
{
constexpr auto white = std::array<std::uint8_t, 3>{255, 255, 255};
constexpr auto black = std::array<std::uint8_t, 3>{0, 0, 0};

std::size_t count_not(const bitmap_backend &backend, std::array<std::uint8_t, 3> color)
{
  auto n = std::size_t{0};
  for (auto y = 0u; y < backend.size.y; ++y)
  {
    for (auto x = 0u; x < backend.size.x; ++x)
    {
      if (pixel_at(backend, glm::ivec2(x, y)) != color)
      {
        ++n;
      }
    }
  }
  return n;
}
} // namespace

TEST(BitmapBackend, RejectsSmallBuffer)
{
  auto buffer = std::vector<std::uint8_t>(3 * 10 * 10 - 1);
  const auto backend = make_bitmap_backend(buffer, {10, 10});
  ASSERT_FALSE(backend.has_value());
  EXPECT_EQ(backend.error().kind, drawing_error_kind::buffer_too_small);
}

TEST(BitmapBackend, UsesPrefixOfLargerBuffer)
{
  auto buffer = std::vector<std::uint8_t>(1000);
  const auto backend = make_bitmap_backend(buffer, {10, 10});
  ASSERT_TRUE(backend.has_value());
  EXPECT_EQ(backend->buffer.size(), 300u);
  EXPECT_EQ(required_buffer_size({10, 10}), 300u);
}

TEST(BitmapBackend, BlendPixel)
{
  auto buffer = std::vector<std::uint8_t>(required_buffer_size({4, 4}));
  auto backend = make_bitmap_backend(buffer, {4, 4});
  ASSERT_TRUE(backend.has_value());

  blend_pixel(backend.value(), {1, 2}, from_rgb(0xff8000));
  EXPECT_EQ(pixel_at(backend.value(), {1, 2}), (std::array<std::uint8_t, 3>{255, 128, 0}));
  EXPECT_EQ(buffer[(2 * 4 + 1) * 3], 255);

  blend_pixel(backend.value(), {0, 0}, from_rgb(0xffffff), 0.5f);
  EXPECT_EQ(pixel_at(backend.value(), {0, 0}), (std::array<std::uint8_t, 3>{128, 128, 128}));

  blend_pixel(backend.value(), {4, 0}, from_rgb(0xffffff));
  blend_pixel(backend.value(), {-1, 0}, from_rgb(0xffffff));
  EXPECT_EQ(count_not(backend.value(), black), 2u);
}

TEST(DrawingArea, SplitVertically)
{
  auto buffer = std::vector<std::uint8_t>(required_buffer_size({30, 20}));
  auto backend = make_bitmap_backend(buffer, {30, 20});
  ASSERT_TRUE(backend.has_value());
  const auto root = into_drawing_area(backend.value());
  EXPECT_EQ(dim_in_pixel(root), glm::uvec2(30, 20));

  const auto [top, rest] = split_vertically(root, 7);
  EXPECT_EQ(dim_in_pixel(top), glm::uvec2(30, 7));
  EXPECT_EQ(dim_in_pixel(rest), glm::uvec2(30, 13));
  EXPECT_EQ(rest.rect.lower_bounds, glm::ivec2(0, 7));

  const auto [all, none] = split_vertically(rest, 100);
  EXPECT_EQ(dim_in_pixel(all), glm::uvec2(30, 13));
  EXPECT_EQ(dim_in_pixel(none), glm::uvec2(30, 0));
}

TEST(DrawingArea, DrawingIsClipped)
{
  auto buffer = std::vector<std::uint8_t>(required_buffer_size({20, 20}));
  auto backend = make_bitmap_backend(buffer, {20, 20});
  ASSERT_TRUE(backend.has_value());
  const auto root = into_drawing_area(backend.value());
  fill(root, background_color);
  EXPECT_EQ(count_not(backend.value(), white), 0u);

  const auto area = sub_area(root, pixel_rect{.lower_bounds = {5, 5}, .upper_bounds = {10, 10}});
  draw_rect(area, {-10, -10}, {100, 100}, from_rgb(0x000000), true);
  EXPECT_EQ(count_not(backend.value(), white), 25u);
  EXPECT_EQ(pixel_at(backend.value(), {5, 5}), black);
  EXPECT_EQ(pixel_at(backend.value(), {4, 5}), white);
  EXPECT_EQ(pixel_at(backend.value(), {10, 9}), white);
}

TEST(DrawingArea, RectOutline)
{
  auto buffer = std::vector<std::uint8_t>(required_buffer_size({10, 10}));
  auto backend = make_bitmap_backend(buffer, {10, 10});
  ASSERT_TRUE(backend.has_value());
  const auto root = into_drawing_area(backend.value());
  fill(root, background_color);

  draw_rect(root, {2, 2}, {6, 5}, from_rgb(0x000000), false);
  // 4x3 rectangle, only the middle pixels of the middle row stay untouched
  EXPECT_EQ(count_not(backend.value(), white), 10u);
  EXPECT_EQ(pixel_at(backend.value(), {3, 3}), white);
  EXPECT_EQ(pixel_at(backend.value(), {5, 4}), black);
}

TEST(DrawingArea, TextStaysInsideArea)
{
  auto buffer = std::vector<std::uint8_t>(required_buffer_size({120, 60}));
  auto backend = make_bitmap_backend(buffer, {120, 60});
  ASSERT_TRUE(backend.has_value());
  const auto root = into_drawing_area(backend.value());
  fill(root, background_color);
  const auto [top, bottom] = split_vertically(root, 20);

  const auto style = text_style{.font = {.family = "sans-serif", .size = 30},
                                .color = from_rgb(0x000000),
                                .anchor = {.h = h_pos::center, .v = v_pos::top}};
  const auto drawn = draw_text(top, "Title", style, {60, 4});
  ASSERT_TRUE(drawn.has_value()) << fmt::format("{}", drawn.error());
  EXPECT_GT(count_not(backend.value(), white), 0u);
  for (auto y = 20; y < 60; ++y)
  {
    for (auto x = 0; x < 120; ++x)
    {
      ASSERT_EQ(pixel_at(backend.value(), {x, y}), white);
    }
  }
}

TEST(DrawingArea, TextFontErrorIsDrawingError)
{
  auto buffer = std::vector<std::uint8_t>(required_buffer_size({10, 10}));
  auto backend = make_bitmap_backend(buffer, {10, 10});
  ASSERT_TRUE(backend.has_value());
  const auto style = text_style{.font = {.size = 12, .file = "/no/such/font.ttf"}};
  const auto drawn = draw_text(into_drawing_area(backend.value()), "x", style, {0, 0});
  ASSERT_FALSE(drawn.has_value());
  EXPECT_EQ(drawn.error().kind, drawing_error_kind::font);
}

TEST(BitmapBackend, WritePpm)
{
  auto buffer = std::vector<std::uint8_t>{1, 2, 3, 4, 5, 6};
  const auto backend = make_bitmap_backend(buffer, {2, 1});
  ASSERT_TRUE(backend.has_value());
  const auto path = std::filesystem::temp_directory_path() / "plotlayout_test_write.ppm";

  const auto written = write_ppm(backend.value(), path);
  ASSERT_TRUE(written.has_value());
  std::ifstream ifs(path, std::ios::binary);
  const auto contents =
      std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
  EXPECT_EQ(contents, std::string("P6\n2 1\n255\n\x01\x02\x03\x04\x05\x06"));
  std::filesystem::remove(path);
}

TEST(BitmapBackend, WritePpmReportsIoError)
{
  auto buffer = std::vector<std::uint8_t>(3);
  const auto backend = make_bitmap_backend(buffer, {1, 1});
  ASSERT_TRUE(backend.has_value());
  const auto written = write_ppm(backend.value(), "/no/such/directory/out.ppm");
  ASSERT_FALSE(written.has_value());
  EXPECT_EQ(written.error().kind, drawing_error_kind::io);
}
