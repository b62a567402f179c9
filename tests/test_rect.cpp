#include <gtest/gtest.h>

#include "rect.hpp"

using namespace plotlayout;

TEST(Rect, DimsAndContains)
{
  const auto r = pixel_rect{.lower_bounds = {2, 3}, .upper_bounds = {12, 8}};
  EXPECT_EQ(dims(r), glm::uvec2(10, 5));
  EXPECT_TRUE(contains(r, {2, 3}));
  EXPECT_TRUE(contains(r, {11, 7}));
  EXPECT_FALSE(contains(r, {12, 7}));
  EXPECT_FALSE(contains(r, {1, 3}));

  const auto inverted = pixel_rect{.lower_bounds = {5, 5}, .upper_bounds = {3, 3}};
  EXPECT_EQ(dims(inverted), glm::uvec2(0, 0));
}

TEST(Rect, Intersect)
{
  const auto a = pixel_rect{.lower_bounds = {0, 0}, .upper_bounds = {10, 10}};
  const auto b = pixel_rect{.lower_bounds = {5, -5}, .upper_bounds = {20, 7}};
  EXPECT_EQ(intersect(a, b), (pixel_rect{.lower_bounds = {5, 0}, .upper_bounds = {10, 7}}));

  const auto c = pixel_rect{.lower_bounds = {30, 30}, .upper_bounds = {40, 40}};
  EXPECT_EQ(dims(intersect(a, c)), glm::uvec2(0, 0));
}

TEST(Rect, SplitAndInset)
{
  const auto r = pixel_rect{.lower_bounds = {0, 10}, .upper_bounds = {50, 40}};
  const auto [top, bottom] = split_vertically(r, 12);
  EXPECT_EQ(top, (pixel_rect{.lower_bounds = {0, 10}, .upper_bounds = {50, 22}}));
  EXPECT_EQ(bottom, (pixel_rect{.lower_bounds = {0, 22}, .upper_bounds = {50, 40}}));

  EXPECT_EQ(inset(r, side_sizes{1, 2, 3, 4}),
            (pixel_rect{.lower_bounds = {3, 11}, .upper_bounds = {46, 38}}));
}

TEST(Rect, RoundToTicks)
{
  const auto symmetric = round_to_ticks(-200.0, 200.0, 5, 1);
  EXPECT_DOUBLE_EQ(symmetric.min, -200.0);
  EXPECT_DOUBLE_EQ(symmetric.max, 200.0);
  EXPECT_DOUBLE_EQ(symmetric.step, 100.0);
  EXPECT_EQ(symmetric.lsd, 1);

  const auto uneven = round_to_ticks(0.0, 10.0, 5, 1);
  EXPECT_DOUBLE_EQ(uneven.min, 0.0);
  EXPECT_DOUBLE_EQ(uneven.step, 3.0);
  EXPECT_DOUBLE_EQ(uneven.max, 9.0);
  EXPECT_EQ(uneven.lsd, 0);

  const auto inside = round_to_ticks(0.13, 0.97, 5, 1);
  EXPECT_GE(inside.min, 0.13);
  EXPECT_LE(inside.max, 0.97);
  EXPECT_GT(inside.step, 0.0);

  const auto empty = round_to_ticks(1.0, 1.0, 5, 1);
  EXPECT_DOUBLE_EQ(empty.step, 0.0);
}

TEST(Rect, FormatForTic)
{
  EXPECT_EQ(format_for_tic(-200.0, 1), "-200");
  EXPECT_EQ(format_for_tic(1500.0, 2), "1500");
  EXPECT_EQ(format_for_tic(3.0, 0), "3");
  EXPECT_EQ(format_for_tic(2.5, -1), "2.5");
  EXPECT_EQ(format_for_tic(-1.25, -2), "-1.25");
  EXPECT_EQ(format_for_tic(0.3, -1), "0.3");
}
