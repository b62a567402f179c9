#include "settings.hpp"
#include <fmt/format.h>
#include <utility>

namespace
{
using namespace plotlayout::settings;

template <settings_id id>
settings_type_t<id> default_value()
{
  return {};
}

template <>
std::uint32_t default_value<settings_id::font_dpi>()
{
  return 72;
}

template <>
std::string default_value<settings_id::font_family>()
{
  return "sans-serif";
}

template <>
std::uint32_t default_value<settings_id::tick_count>()
{
  return 5;
}

template <>
std::uint32_t default_value<settings_id::tick_digits>()
{
  return 1;
}

template <settings_id id>
settings_type_t<id> place = default_value<id>();

template <settings_id id>
std::string show_()
{
  return fmt::format("{}", place<id>);
}
} // namespace

namespace plotlayout
{
namespace settings
{
template <settings_id id>
void set(settings_type_t<id> value)
{
  place<id> = std::move(value);
}

template void set<settings_id::font_dpi>(std::uint32_t);
template void set<settings_id::font_family>(std::string);
template void set<settings_id::tick_count>(std::uint32_t);
template void set<settings_id::tick_digits>(std::uint32_t);

void unset(settings_id id)
{
  switch (id)
  {
  case settings_id::font_dpi:
    place<settings_id::font_dpi> = default_value<settings_id::font_dpi>();
    break;
  case settings_id::font_family:
    place<settings_id::font_family> = default_value<settings_id::font_family>();
    break;
  case settings_id::tick_count:
    place<settings_id::tick_count> = default_value<settings_id::tick_count>();
    break;
  case settings_id::tick_digits:
    place<settings_id::tick_digits> = default_value<settings_id::tick_digits>();
    break;
  }
}

std::string show(settings_id id)
{
  switch (id)
  {
  case settings_id::font_dpi:
    return show_<settings_id::font_dpi>();
  case settings_id::font_family:
    return show_<settings_id::font_family>();
  case settings_id::tick_count:
    return show_<settings_id::tick_count>();
  case settings_id::tick_digits:
    return show_<settings_id::tick_digits>();
  }
  return "";
}

std::uint32_t font_dpi() { return place<settings_id::font_dpi>; }
const std::string &font_family() { return place<settings_id::font_family>; }
std::uint32_t tick_count() { return place<settings_id::tick_count>; }
std::uint32_t tick_digits() { return place<settings_id::tick_digits>; }
} // namespace settings
} // namespace plotlayout
