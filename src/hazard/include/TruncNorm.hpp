#pragma once
#include <span>
#include <vector>

/**
 * @file TruncNorm.hpp
 * @brief Standard normal truncated to ``[-tl, tl]`` and its split into epsilon bands.
 *
 * @details
 * For a rupture whose ground-motion residual must exceed ``lvl`` standard deviations, the
 * exceedance probability restricted to band ``[e_k, e_{k+1})`` is
 * ``max(0, F(e_{k+1}) - F(max(e_k, lvl)))`` with ``F`` the truncated CDF. Summed over all
 * bands this equals the survival function ``1 - F(lvl)``.
 */

namespace hazard
{

class TruncatedNormal
{
  public:
    explicit TruncatedNormal(double truncation_level);

    double truncation_level() const noexcept { return tl_; }
    double cdf(double x) const noexcept;
    double sf(double x) const noexcept { return 1.0 - cdf(x); }

  private:
    double tl_;
    double phi_lo_;
    double norm_;
};

class EpsilonBins
{
  public:
    EpsilonBins(double truncation_level, std::vector<double> edges);

    std::size_t size() const noexcept { return edges_.size() - 1; }
    const std::vector<double>& edges() const noexcept { return edges_; }

    // out[k] = exceedance probability of `lvl` falling in band k; out.size() == size()
    void contributions(double lvl, std::span<double> out) const;

  private:
    TruncatedNormal dist_;
    std::vector<double> edges_;
    std::vector<double> cdf_edges_;
};

} // namespace hazard
