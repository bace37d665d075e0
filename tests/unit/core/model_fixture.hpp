#pragma once
// Small in-memory models shared by the task farm and calculator tests
#include "Disaggregator.hpp"
#include "Params.hpp"
#include "store/MemoryRuptureStore.hpp"
#include <cmath>
#include <memory>
#include <stdexcept>
#include <vector>

namespace fixture
{

using disagg::store::MemoryRuptureStore;
using hazard::Column;

// Median intensity `median` for every rupture, unit log-sigma
class StubGmm final : public hazard::IGroundMotionModel
{
  public:
    explicit StubGmm(double median = 0.1) : mu_(std::log(median)) {}
    const char* name() const override { return "stub"; }
    hazard::MeanStd mean_std(const hazard::RuptureContext&, const hazard::Imt&) const override
    {
        return {mu_, 1.0};
    }

  private:
    double mu_;
};

class BrokenGmm final : public hazard::IGroundMotionModel
{
  public:
    const char* name() const override { return "broken"; }
    hazard::MeanStd mean_std(const hazard::RuptureContext&, const hazard::Imt&) const override
    {
        throw std::runtime_error("broken gmm");
    }
};

inline hazard::CalcParams pga_params()
{
    hazard::CalcParams p;
    p.imtls.add("PGA", {0.05, 0.1, 0.2});
    p.poes_disagg = {0.1};
    p.maximum_distance.default_km = 100.0;
    p.mag_bin_width = 1.0;
    p.distance_bin_width = 50.0;
    p.coordinate_bin_width = 1.0;
    p.num_epsilon_bins = 1;
    p.concurrent_tasks = 4;
    return p;
}

/// One site at the origin, one source group, one realization ("stub") and two ruptures in
/// different magnitude and distance bins but the same lon/lat cell.
inline MemoryRuptureStore one_site_store()
{
    MemoryRuptureStore s;
    s.sitecol =
        hazard::SiteCollection(std::vector<hazard::Site>{hazard::Site{0, 0.0, 0.0, 760.0}});
    s.trt_names = {"Active Shallow Crust"};
    s.source_mags = {{"Active Shallow Crust", {5.5, 6.5}}};
    s.grp_trt = {0};
    s.grp_rlzs = {hazard::RlzsByGsim{{"stub", {0}}}};
    s.rlz_weights = {1.0};

    s.columns["mag"] = Column{{5.5, 6.5}, 1};
    s.columns["rake"] = Column{{0.0, 0.0}, 1};
    s.columns["hypo_depth"] = Column{{10.0, 10.0}, 1};
    s.columns["occurrence_rate"] = Column{{0.01, 0.01}, 1};
    s.columns["rrup_"] = Column{{20.0, 60.0}, 1};
    s.columns["rjb_"] = Column{{20.0, 60.0}, 1};
    s.columns["lon_"] = Column{{0.1, 0.2}, 1};
    s.columns["lat_"] = Column{{0.1, 0.1}, 1};
    s.grp_ids = {0, 0};

    s.hcurves[{0, 0}] = {0.5, 0.2, 0.05};
    s.pcurves[{0, 0, 0}] = {0.5, 0.2, 0.05};
    return s;
}

/// Two sites, two source groups of different TRTs and two realizations:
/// group 0 uses gsim A for rlz 0 and B for rlz 1, group 1 uses C for both.
inline MemoryRuptureStore two_rlz_store()
{
    MemoryRuptureStore s;
    s.sitecol = hazard::SiteCollection(std::vector<hazard::Site>{
        hazard::Site{0, 0.0, 0.0, 760.0}, hazard::Site{1, 0.3, 0.0, 400.0}});
    s.trt_names = {"Active Shallow Crust", "Stable Continental"};
    s.source_mags = {{"Active Shallow Crust", {5.5, 6.5}}, {"Stable Continental", {6.0, 6.2}}};
    s.grp_trt = {0, 1};
    s.grp_rlzs = {hazard::RlzsByGsim{{"A", {0}}, {"B", {1}}}, hazard::RlzsByGsim{{"C", {0, 1}}}};
    s.rlz_weights = {0.5, 0.5};

    // rows: ruptures; columns ending in '_' have one value per site
    s.columns["mag"] = Column{{5.5, 6.5, 6.0, 6.2}, 1};
    s.columns["rake"] = Column{{0.0, 90.0, 0.0, -90.0}, 1};
    s.columns["hypo_depth"] = Column{{10.0, 15.0, 5.0, 8.0}, 1};
    s.columns["occurrence_rate"] = Column{{0.01, 0.002, 0.005, 0.004}, 1};
    s.columns["rrup_"] = Column{{20.0, 30.0, 60.0, 55.0, 40.0, 45.0, 80.0, 90.0}, 2};
    s.columns["rjb_"] = Column{{18.0, 28.0, 58.0, 53.0, 39.0, 44.0, 79.0, 89.0}, 2};
    s.columns["lon_"] = Column{{0.1, 0.1, 0.2, 0.2, -0.1, 0.3, 0.0, 0.4}, 2};
    s.columns["lat_"] = Column{{0.1, 0.1, 0.1, 0.1, 0.1, 0.1, 0.1, 0.1}, 2};
    s.grp_ids = {0, 0, 1, 1};

    for (int sid = 0; sid < 2; ++sid)
    {
        s.hcurves[{sid, 0}] = {0.5, 0.2, 0.05};
        s.hcurves[{sid, 1}] = {0.4, 0.15, 0.03};
    }
    return s;
}

inline hazard::GmmsByName two_rlz_gmms()
{
    return {{"A", std::make_shared<StubGmm>(0.1)},
            {"B", std::make_shared<StubGmm>(0.05)},
            {"C", std::make_shared<StubGmm>(0.08)}};
}

} // namespace fixture
