#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

//! @brief Mapping sampled fields to colours: colourmaps, scale policies,
//! contour levels, and output naming. No file I/O.
namespace Render {

//! 8-bit RGB colour
struct RGB {
  std::uint8_t r, g, b;

  //! e.g., "#ffa500"
  std::string hex() const;
  //! From "#rrggbb" or "rrggbb". Throws horbital::InvalidOptionError
  static RGB from_hex(std::string_view hex);

  friend bool operator==(const RGB &a, const RGB &b) {
    return a.r == b.r && a.g == b.g && a.b == b.b;
  }
  friend bool operator!=(const RGB &a, const RGB &b) { return !(a == b); }
};

//==============================================================================
//! Named colourmap: anchor colours, evenly spaced on [0,1], linearly
//! interpolated between.
class Colourmap {
  std::string m_name;
  std::vector<RGB> m_anchors;

public:
  //! anchors must have at least 2 colours
  Colourmap(std::string name, std::vector<RGB> anchors);

  //! Look up by name (case sensitive, as matplotlib). Accepts "_r" suffix
  //! for reversed maps, and the presets "sample" (-> RdYlBu_r) and
  //! "sample_density" (-> YlOrRd). Throws horbital::InvalidOptionError
  static Colourmap named(std::string_view name);

  //! List of all accepted names (incl. _r variants and presets)
  static std::vector<std::string> available();

  const std::string &name() const { return m_name; }
  const std::vector<RGB> &anchors() const { return m_anchors; }

  //! Colour at position x in [0,1] (clamped)
  RGB at(double x) const;

  //! Same colours, in reverse order; name gets (or loses) "_r"
  Colourmap reversed() const;
};

//! Default colourmap name
constexpr std::string_view default_colourmap = "RdYlBu_r";

} // namespace Render
