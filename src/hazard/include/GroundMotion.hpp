#pragma once
#include "Imt.hpp"
#include <cmath>
#include <map>
#include <string>

/**
 * @file GroundMotion.hpp
 * @brief Rupture context, temporal occurrence model and the ground-motion model interface.
 *
 * @details
 * A :cpp:struct:`hazard::RuptureContext` describes one rupture as seen from one site. It is
 * built from a column mapping read out of the rupture store: rupture-level columns
 * (``mag``, ``rake``, ``hypo_depth``, ``occurrence_rate``), site-dependent columns already
 * sliced at the site (``rrup``, ``rjb``, ``lon``, ``lat``) and the site parameter ``vs30``.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   std::map<std::string, double> cols{{"mag", 6.1}, {"rake", 0}, {"hypo_depth", 10},
 *                                      {"occurrence_rate", 1e-3}, {"rrup", 25}, {"rjb", 24},
 *                                      {"lon", 0.2}, {"lat", 0.1}, {"vs30", 760}};
 *   auto ctx = hazard::RuptureContext::from_columns(cols, hazard::PoissonTOM{50.0});
 *   hazard::MeanStd ms = gmm.mean_std(ctx, hazard::Imt::parse("PGA"));
 * @endrst
 */

namespace hazard
{

struct PoissonTOM
{
    double time_span = 50.0;

    // Probability of no exceedance over the time span for a rupture of annual `rate`
    // whose ground motion exceeds the level with probability `poe`.
    double pne(double rate, double poe) const noexcept { return std::exp(-rate * time_span * poe); }
};

struct RuptureContext
{
    double mag = 0.0;
    double rake = 0.0;
    double hypo_depth = 0.0;
    double occurrence_rate = 0.0;
    double rrup = 0.0;
    double rjb = 0.0;
    double lon = 0.0; // closest point of the rupture to the site
    double lat = 0.0;
    double vs30 = 760.0;
    PoissonTOM tom;

    // Throws ConfigError naming the first missing or unknown column
    static RuptureContext from_columns(const std::map<std::string, double>& cols,
                                       PoissonTOM tom);
};

struct MeanStd
{
    double mean = 0.0; // natural log of the median intensity
    double sigma = 1.0;
};

class IGroundMotionModel
{
  public:
    virtual ~IGroundMotionModel() = default;
    virtual const char* name() const = 0;
    virtual MeanStd mean_std(const RuptureContext& ctx, const Imt& imt) const = 0;
};

} // namespace hazard
