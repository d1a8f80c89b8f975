#pragma once
#include <string>

// Manually define major/minor horbital versions
#define HORBITAL_VERSION "0.1"
#define HORBITAL_MAJOR_VERSION 0
#define HORBITAL_MINOR_VERSION 1

//==============================================================================
//! Information about the horbital code (version, compiler, libraries).
/*! @details Defines the macros:
HORBITAL_VERSION, HORBITAL_MAJOR_VERSION, HORBITAL_MINOR_VERSION
(defined in version.hpp).
Also uses the macros: GITREVISION, CXXVERSION, COMPTIME
These should be set using compile flags (-D) on compilation.
*/
namespace version {

//! String with version info, including git revision if known
std::string version();

//! String with compilation info: which compiler was used and the time of
//! compilation
std::string compiled();

//! String containing details (version numbers) of libraries (GSL, fmt)
std::string libraries();

} // namespace version
