#include "version.hpp"
#include "qip/omp.hpp"
#include <fmt/format.h>
#include <gsl/gsl_version.h>
#include <string>

// Macro translates constants to "strings"
#define XSTRING(s) STRING(s)
#define STRING(s) #s

// These are passed in at compile time via -D flag.
// If not set, the code will still work (these will just be blank)
#ifndef GITREVISION
#define GITREVISION
#endif
#ifndef CXXVERSION
#define CXXVERSION
#endif
#ifndef COMPTIME
#define COMPTIME
#endif

//==============================================================================
namespace version {

static const std::string git_revision = XSTRING(GITREVISION);
static const std::string cxx_version = XSTRING(CXXVERSION);
static const std::string compiled_time = XSTRING(COMPTIME);
static const std::string horbital_version = HORBITAL_VERSION;

std::string version() {
  return git_revision.empty() ? horbital_version :
                                horbital_version + " [" + git_revision + "]";
}

std::string compiled() { return cxx_version + " " + compiled_time; }

std::string libraries() {
  return fmt::format("GSL: {}\nfmt: {}.{}.{}\n{}", GSL_VERSION,
                     FMT_VERSION / 10000, (FMT_VERSION % 10000) / 100,
                     FMT_VERSION % 100, qip::omp_details());
}

} // namespace version
