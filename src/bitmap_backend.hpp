#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <glm/vec2.hpp>
#include <glm/vec4.hpp>
#include "errors.hpp"

namespace plotlayout
{
inline constexpr std::size_t bytes_per_pixel = 3;

// RGB pixels, row-major, in a buffer owned by the caller
struct bitmap_backend final
{
  std::span<std::uint8_t> buffer;
  glm::uvec2 size;
};

std::size_t required_buffer_size(glm::uvec2 size);

std::expected<bitmap_backend, drawing_error> make_bitmap_backend(std::span<std::uint8_t> buffer,
                                                                 glm::uvec2 size);

// pixels outside the bitmap are ignored
void blend_pixel(const bitmap_backend &backend, glm::ivec2 p, const glm::vec4 &color,
                 float coverage = 1.0f);
std::array<std::uint8_t, 3> pixel_at(const bitmap_backend &backend, glm::ivec2 p);

std::expected<void, drawing_error> write_ppm(const bitmap_backend &backend,
                                             const std::filesystem::path &path);
} // namespace plotlayout
