#include "TruncNorm.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace hazard
{

static double std_normal_cdf(double x) noexcept
{
    return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

TruncatedNormal::TruncatedNormal(double tl) : tl_(tl)
{
    if (!(tl > 0.0))
        throw ConfigError("truncation_level must be positive for disaggregation");
    phi_lo_ = std_normal_cdf(-tl);
    norm_ = std_normal_cdf(tl) - phi_lo_;
}

double TruncatedNormal::cdf(double x) const noexcept
{
    if (x <= -tl_)
        return 0.0;
    if (x >= tl_)
        return 1.0;
    return (std_normal_cdf(x) - phi_lo_) / norm_;
}

EpsilonBins::EpsilonBins(double tl, std::vector<double> edges)
    : dist_(tl), edges_(std::move(edges))
{
    if (edges_.size() < 2)
        throw ConfigError("epsilon edges need at least two values");
    cdf_edges_.reserve(edges_.size());
    for (double e : edges_)
        cdf_edges_.push_back(dist_.cdf(e));
}

void EpsilonBins::contributions(double lvl, std::span<double> out) const
{
    if (out.size() != size())
        throw std::invalid_argument("EpsilonBins::contributions: wrong output size");
    const double F_lvl = dist_.cdf(lvl);
    for (std::size_t k = 0; k < size(); ++k)
    {
        const double lo = edges_[k] > lvl ? cdf_edges_[k] : F_lvl;
        out[k] = std::max(0.0, cdf_edges_[k + 1] - lo);
    }
}

} // namespace hazard
