#pragma once

#include <cstdint>
#include <string>

namespace plotlayout
{
namespace settings
{
enum class settings_id
{
  font_dpi,
  font_family,
  tick_count,
  tick_digits
};

template <settings_id id>
struct settings_type
{
  using type = std::uint32_t;
};

template <>
struct settings_type<settings_id::font_family>
{
  using type = std::string;
};

template <settings_id id>
using settings_type_t = typename settings_type<id>::type;

template <settings_id id>
void set(settings_type_t<id> value);

void unset(settings_id id);
std::string show(settings_id id);

// resolution used to convert font sizes to pixels; 72 makes one point one pixel
std::uint32_t font_dpi();
// family used when a font_desc leaves its family empty
const std::string &font_family();
std::uint32_t tick_count();
std::uint32_t tick_digits();
} // namespace settings
} // namespace plotlayout
