#include "BinEdges.hpp"
#include "IntensityResolver.hpp"
#include "RealizationSelector.hpp"
#include "master/Log.hpp"
#include "master/RunContext.hpp"
#include "master/TaskFarm.hpp"
#include "simple_bench.hpp"
#include "store/MemoryRuptureStore.hpp"
#include <cmath>
#include <memory>
#include <random>
#include <tuple>

using namespace disagg;

namespace
{

class DistanceModel final : public hazard::IGroundMotionModel
{
  public:
    const char* name() const override { return "distance"; }
    hazard::MeanStd mean_std(const hazard::RuptureContext& c, const hazard::Imt&) const override
    {
        return {0.5 + 0.9 * (c.mag - 6.0) - 1.1 * std::log(c.rrup + 10.0), 0.6};
    }
};

store::MemoryRuptureStore synthetic_store(std::size_t U)
{
    store::MemoryRuptureStore s;
    s.sitecol = hazard::SiteCollection(std::vector<hazard::Site>{hazard::Site{0, 10.0, 45.0, 760.0}});
    s.trt_names = {"Active Shallow Crust"};
    s.grp_trt = {0};
    s.grp_rlzs = {hazard::RlzsByGsim{{"distance", {0}}}};
    s.rlz_weights = {1.0};

    std::mt19937 rng(42);
    std::uniform_real_distribution<double> mag(5.0, 7.9), rrup(1.0, 190.0), off(-1.5, 1.5);
    std::vector<double> mags;
    for (const char* c : {"mag", "rake", "hypo_depth", "occurrence_rate", "rrup_", "rjb_", "lon_",
                          "lat_"})
        s.columns[c].ncols = 1;
    for (std::size_t u = 0; u < U; ++u)
    {
        const double m = mag(rng), r = rrup(rng);
        mags.push_back(m);
        s.columns["mag"].values.push_back(m);
        s.columns["rake"].values.push_back(90.0);
        s.columns["hypo_depth"].values.push_back(10.0);
        s.columns["occurrence_rate"].values.push_back(1e-4);
        s.columns["rrup_"].values.push_back(r);
        s.columns["rjb_"].values.push_back(r);
        s.columns["lon_"].values.push_back(10.0 + off(rng));
        s.columns["lat_"].values.push_back(45.0 + off(rng));
        s.grp_ids.push_back(0);
    }
    s.source_mags = {{"Active Shallow Crust", mags}};
    s.hcurves[{0, 0}] = {0.3, 0.1, 0.02, 0.003};
    return s;
}

} // namespace

int main(int argc, char** argv)
{
    int provided = 0;
    MPI_Init_thread(&argc, &argv, MPI_THREAD_FUNNELED, &provided);
    master::logx::init({master::logx::Level::Warn, false});
    {
        constexpr std::size_t U = 20000;
        const auto store = synthetic_store(U);

        hazard::CalcParams params;
        params.imtls.add("PGA", {0.05, 0.1, 0.2, 0.4});
        params.poes_disagg = {0.1, 0.02};
        params.maximum_distance.default_km = 200.0;
        params.mag_bin_width = 0.5;
        params.distance_bin_width = 20.0;
        params.coordinate_bin_width = 0.5;
        params.num_epsilon_bins = 4;

        const auto [edges, shape] =
            hazard::build_bin_edges(params, store.sites(), store.mags_by_trt(), false);
        const hazard::CurveGetter get = [&](int sid, int rlz) { return store.curve(sid, rlz); };
        const auto sel = hazard::select_realizations(params, 1, 1, store.weights(params.imtls), get);
        const auto res = hazard::resolve_intensities(params, sel.rlzs, get);
        const std::vector<hazard::RlzsByGsim> rbg{store.rlzs_by_gsim(0)};
        const hazard::GmmsByName gmms{{"distance", std::make_shared<DistanceModel>()}};
        const hazard::TaskInputs in{params,       edges, store.sites(), sel.rlzs, res.iml3,
                                    res.ok_sites, rbg,   gmms};

        const auto tasks =
            master::build_tasks(store, edges.mag, 1, master::task_blocksize(U, 16, 1));
        master::RunContext rc{};
        master::TaskFarm farm(rc, store);

        auto [mean, stddev] = bench::run([&] { (void) farm.run_local(tasks, in); }, 5);
        bench::report("task_farm_20k_ruptures", mean, stddev, double(U));
    }
    MPI_Finalize();
    return 0;
}
