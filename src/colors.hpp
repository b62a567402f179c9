#pragma once

#include <glm/vec4.hpp>

namespace plotlayout
{
constexpr glm::vec4 from_rgb(int rgb)
{
  return {static_cast<float>((rgb >> 16) & 0xFF) / 255.0f,
          static_cast<float>((rgb >> 8) & 0xFF) / 255.0f, static_cast<float>(rgb & 0xFF) / 255.0f,
          1.0f};
}

inline constexpr glm::vec4 background_color = from_rgb(0xffffff);
inline constexpr glm::vec4 axis_color = from_rgb(0x4c566a);
inline constexpr glm::vec4 text_color = from_rgb(0x2e3440);
inline constexpr glm::vec4 caption_color = from_rgb(0x000000);

} // namespace plotlayout
