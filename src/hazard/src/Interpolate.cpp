#include "Interpolate.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace hazard
{

double interp(double x, std::span<const double> xp, std::span<const double> fp)
{
    if (xp.empty() || xp.size() != fp.size())
        throw std::invalid_argument("interp: xp and fp must be non-empty and of equal size");
    if (std::isnan(x))
        return std::numeric_limits<double>::quiet_NaN();
    if (x <= xp.front())
        return fp.front();
    if (x >= xp.back())
        return fp.back();
    // first j with xp[j] > x; x lies in [xp[j-1], xp[j])
    const auto it = std::upper_bound(xp.begin(), xp.end(), x);
    const std::size_t j = static_cast<std::size_t>(it - xp.begin());
    const double x0 = xp[j - 1], x1 = xp[j];
    if (x1 == x0)
        return fp[j];
    const double t = (x - x0) / (x1 - x0);
    return fp[j - 1] + t * (fp[j] - fp[j - 1]);
}

} // namespace hazard
