// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Window tables and frequency axes are computed in double precision and
// narrowed to float when stored.
// ==============================================================================

#pragma once

namespace Sono {
namespace DSP {

inline constexpr double kPiD = 3.14159265358979323846;

/// Window phase: x = kTwoPiD * n / (N - 1)
inline constexpr double kTwoPiD = 2.0 * kPiD;

} // namespace DSP
} // namespace Sono
