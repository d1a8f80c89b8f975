#pragma once
#include "horbital/Errors.hpp"
#include "qip/String.hpp"
#include <string>
#include <string_view>

namespace Render {

//! Colour-scale policy: how raw field values map to intensities
enum class Scale { linear, log, symlog };

//! As requested by the user: 'automatic' is resolved per mode (see
//! ColourScale.hpp: resolve_scale)
enum class ScaleRequest { linear, log, symlog, automatic };

inline std::string_view scale_name(Scale scale) {
  switch (scale) {
  case Scale::linear:
    return "linear";
  case Scale::log:
    return "log";
  case Scale::symlog:
    return "symlog";
  }
  return "unknown";
}

//! Parses "linear", "log", "symlog", "auto" (case insensitive). Throws
//! horbital::InvalidOptionError otherwise
inline ScaleRequest parse_scale(std::string_view name) {
  if (qip::ci_compare(name, "linear"))
    return ScaleRequest::linear;
  if (qip::ci_compare(name, "log"))
    return ScaleRequest::log;
  if (qip::ci_compare(name, "symlog"))
    return ScaleRequest::symlog;
  if (qip::ci_compare(name, "auto"))
    return ScaleRequest::automatic;
  throw horbital::InvalidOptionError(
      "Unknown scale '" + std::string(name) +
      "'; expected one of: linear, log, symlog, auto");
}

} // namespace Render
