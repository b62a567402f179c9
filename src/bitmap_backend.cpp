#include "bitmap_backend.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <ios>
#include <fmt/format.h>

namespace
{
using namespace plotlayout;

bool inside(const bitmap_backend &backend, glm::ivec2 p)
{
  return p.x >= 0 && p.y >= 0 && static_cast<unsigned>(p.x) < backend.size.x
         && static_cast<unsigned>(p.y) < backend.size.y;
}

std::size_t offset_of(const bitmap_backend &backend, glm::ivec2 p)
{
  return (static_cast<std::size_t>(p.y) * backend.size.x + static_cast<std::size_t>(p.x))
         * bytes_per_pixel;
}

std::uint8_t blend_channel(std::uint8_t dst, float src, float alpha)
{
  const auto value = static_cast<float>(dst) * (1.0f - alpha) + src * 255.0f * alpha;
  return static_cast<std::uint8_t>(std::clamp(std::round(value), 0.0f, 255.0f));
}
} // namespace

namespace plotlayout
{
std::size_t required_buffer_size(glm::uvec2 size)
{
  return static_cast<std::size_t>(size.x) * size.y * bytes_per_pixel;
}

std::expected<bitmap_backend, drawing_error> make_bitmap_backend(std::span<std::uint8_t> buffer,
                                                                 glm::uvec2 size)
{
  const auto required = required_buffer_size(size);
  if (buffer.size() < required)
  {
    return std::unexpected(
        drawing_error{.kind = drawing_error_kind::buffer_too_small,
                      .detail = fmt::format("{}x{} pixels need {} bytes, buffer holds {}", size.x,
                                            size.y, required, buffer.size())});
  }
  return bitmap_backend{.buffer = buffer.first(required), .size = size};
}

void blend_pixel(const bitmap_backend &backend, glm::ivec2 p, const glm::vec4 &color,
                 float coverage)
{
  if (!inside(backend, p))
  {
    return;
  }
  const auto alpha = std::clamp(color.a * coverage, 0.0f, 1.0f);
  auto *px = backend.buffer.data() + offset_of(backend, p);
  px[0] = blend_channel(px[0], color.r, alpha);
  px[1] = blend_channel(px[1], color.g, alpha);
  px[2] = blend_channel(px[2], color.b, alpha);
}

std::array<std::uint8_t, 3> pixel_at(const bitmap_backend &backend, glm::ivec2 p)
{
  if (!inside(backend, p))
  {
    return {0, 0, 0};
  }
  const auto *px = backend.buffer.data() + offset_of(backend, p);
  return {px[0], px[1], px[2]};
}

std::expected<void, drawing_error> write_ppm(const bitmap_backend &backend,
                                             const std::filesystem::path &path)
{
  std::ofstream ofs(path, std::ios::out | std::ios::binary);
  if (!ofs)
  {
    return std::unexpected(drawing_error{
        .kind = drawing_error_kind::io, .detail = fmt::format("cannot open '{}'", path.string())});
  }
  ofs << "P6\n" << backend.size.x << ' ' << backend.size.y << "\n255\n";
  ofs.write(reinterpret_cast<const char *>(backend.buffer.data()),
            static_cast<std::streamsize>(backend.buffer.size()));
  if (!ofs.flush())
  {
    return std::unexpected(drawing_error{
        .kind = drawing_error_kind::io, .detail = fmt::format("cannot write '{}'", path.string())});
  }
  return {};
}
} // namespace plotlayout
