#pragma once
#include <string>

// #include this instead of <omp.h>: grid loops then compile (single-threaded)
// without OpenMP

#if defined(_OPENMP)
#include <omp.h>
namespace qip {
constexpr bool use_omp = true;
inline int omp_threads() { return omp_get_max_threads(); }
} // namespace qip
#else
#pragma GCC diagnostic ignored "-Wunknown-pragmas"
namespace qip {
constexpr bool use_omp = false;
inline int omp_threads() { return 1; }
} // namespace qip
#endif

namespace qip {
//! e.g., "OpenMP, 8 threads"
inline std::string omp_details() {
  return use_omp ? "OpenMP, " + std::to_string(omp_threads()) + " threads" :
                   "Single-threaded";
}
} // namespace qip
