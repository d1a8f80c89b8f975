#include "Colourmap.hpp"
#include "horbital/Errors.hpp"
#include "qip/Maths.hpp"
#include "qip/String.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fmt/format.h>
#include <string>
#include <utility>
#include <vector>

namespace Render {

//==============================================================================
std::string RGB::hex() const {
  return fmt::format("#{:02x}{:02x}{:02x}", r, g, b);
}

RGB RGB::from_hex(std::string_view hex) {
  if (!hex.empty() && hex.front() == '#')
    hex.remove_prefix(1);
  const auto is_hex = [](char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
  };
  if (hex.size() != 6 || !std::all_of(hex.cbegin(), hex.cend(), is_hex)) {
    throw horbital::InvalidOptionError(
        fmt::format("Invalid colour '{}': expected #rrggbb", hex));
  }
  const auto byte = [&](std::size_t i) {
    return static_cast<std::uint8_t>(
        std::stoi(std::string(hex.substr(i, 2)), nullptr, 16));
  };
  return {byte(0), byte(2), byte(4)};
}

//==============================================================================
namespace {

struct NamedAnchors {
  std::string_view name;
  std::vector<std::string_view> hex;
};

// Anchor colours for each base colourmap (as ColorBrewer / matplotlib)
const std::vector<NamedAnchors> &base_colourmaps() {
  static const std::vector<NamedAnchors> maps{
      {"RdYlBu",
       {"a50026", "d73027", "f46d43", "fdae61", "fee090", "ffffbf", "e0f3f8",
        "abd9e9", "74add1", "4575b4", "313695"}},
      {"YlOrRd",
       {"ffffcc", "ffeda0", "fed976", "feb24c", "fd8d3c", "fc4e2a", "e31a1c",
        "bd0026", "800026"}},
      {"RdBu",
       {"67001f", "b2182b", "d6604d", "f4a582", "fddbc7", "f7f7f7", "d1e5f0",
        "92c5de", "4393c3", "2166ac", "053061"}},
      {"viridis",
       {"440154", "472c7a", "3b518b", "2c718e", "21908d", "27ad81", "5cc863",
        "aadc32", "fde725"}},
      {"Greys",
       {"ffffff", "f0f0f0", "d9d9d9", "bdbdbd", "969696", "737373", "525252",
        "252525", "000000"}},
      {"seismic", {"00004c", "0000ff", "ffffff", "ff0000", "800000"}},
      {"coolwarm",
       {"3b4cc0", "6788ee", "9abbff", "c9d7f0", "edd1c2", "f7a889", "e26952",
        "b40426"}}};
  return maps;
}

// Preset -> actual colourmap name
const std::vector<std::pair<std::string_view, std::string_view>> &presets() {
  static const std::vector<std::pair<std::string_view, std::string_view>> p{
      {"sample", "RdYlBu_r"}, {"sample_density", "YlOrRd"}};
  return p;
}

std::string_view strip_reversed(std::string_view name) {
  constexpr std::string_view suffix = "_r";
  if (name.size() > suffix.size() &&
      name.substr(name.size() - suffix.size()) == suffix)
    return name.substr(0, name.size() - suffix.size());
  return name;
}

} // namespace

//==============================================================================
Colourmap::Colourmap(std::string name, std::vector<RGB> anchors)
    : m_name(std::move(name)), m_anchors(std::move(anchors)) {
  if (m_anchors.size() < 2) {
    throw horbital::InvalidOptionError(
        fmt::format("Colourmap {} needs at least two colours", m_name));
  }
}

Colourmap Colourmap::named(std::string_view name) {
  for (const auto &[preset, actual] : presets()) {
    if (name == preset)
      return named(actual);
  }

  const auto base_name = strip_reversed(name);
  const auto is_reversed = base_name.size() != name.size();
  for (const auto &base : base_colourmaps()) {
    if (base.name != base_name)
      continue;
    std::vector<RGB> anchors;
    anchors.reserve(base.hex.size());
    for (const auto hex : base.hex)
      anchors.push_back(RGB::from_hex(hex));
    Colourmap cmap{std::string(base.name), std::move(anchors)};
    return is_reversed ? cmap.reversed() : cmap;
  }

  const auto names = available();
  const auto closest = qip::ci_closest_match(name, names);
  throw horbital::InvalidOptionError(
      fmt::format("Unknown colourmap '{}' (did you mean '{}'?). Available: {}",
                  name, *closest, qip::concat(names, ", ")));
}

std::vector<std::string> Colourmap::available() {
  std::vector<std::string> names;
  for (const auto &base : base_colourmaps()) {
    names.emplace_back(base.name);
    names.push_back(std::string(base.name) + "_r");
  }
  for (const auto &preset : presets())
    names.emplace_back(preset.first);
  return names;
}

//==============================================================================
RGB Colourmap::at(double x) const {
  x = qip::clamp(x, 0.0, 1.0);
  const auto num_intervals = double(m_anchors.size() - 1);
  const auto pos = x * num_intervals;
  const auto i0 = std::min(std::size_t(pos), m_anchors.size() - 2);
  const auto t = pos - double(i0);
  const auto &c0 = m_anchors[i0];
  const auto &c1 = m_anchors[i0 + 1];
  const auto lerp = [t](std::uint8_t a, std::uint8_t b) {
    return static_cast<std::uint8_t>(
        std::lround(double(a) + t * (double(b) - double(a))));
  };
  return {lerp(c0.r, c1.r), lerp(c0.g, c1.g), lerp(c0.b, c1.b)};
}

Colourmap Colourmap::reversed() const {
  const auto base_name = strip_reversed(m_name);
  auto new_name = base_name.size() == m_name.size() ? m_name + "_r" :
                                                      std::string(base_name);
  return Colourmap{std::move(new_name),
                   {m_anchors.crbegin(), m_anchors.crend()}};
}

} // namespace Render
