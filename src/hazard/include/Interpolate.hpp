#pragma once
#include <span>

namespace hazard
{

/// Piecewise-linear interpolation at `x` over increasing `xp`; clamped to fp.front()/fp.back()
/// outside the range. Sizes of `xp` and `fp` must match and be non-zero.
double interp(double x, std::span<const double> xp, std::span<const double> fp);

} // namespace hazard
