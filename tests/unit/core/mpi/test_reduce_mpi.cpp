#include "BinEdges.hpp"
#include "IntensityResolver.hpp"
#include "RealizationSelector.hpp"
#include "master/Reduce.hpp"
#include "master/RunContext.hpp"
#include "master/TaskFarm.hpp"
#include "model_fixture.hpp"
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <stdexcept>
#include <tuple>
#include <vector>

#include <mpi.h>

using namespace disagg::master;
using Catch::Approx;

namespace
{

struct Prepared
{
    hazard::CalcParams params = fixture::pga_params();
    fixture::MemoryRuptureStore store = fixture::two_rlz_store();
    hazard::BinEdges edges;
    hazard::ShapeDic shape;
    hazard::RlzSelection sel;
    hazard::ResolvedIntensities res;
    std::vector<hazard::RlzsByGsim> rbg;
    hazard::GmmsByName gmms = fixture::two_rlz_gmms();

    Prepared()
    {
        params.num_rlzs_disagg = 2;
        std::tie(edges, shape) =
            hazard::build_bin_edges(params, store.sites(), store.mags_by_trt(), false);
        const hazard::CurveGetter get = [this](int sid, int rlz) { return store.curve(sid, rlz); };
        sel = hazard::select_realizations(params, store.sites().size(), store.num_rlzs(),
                                          store.weights(params.imtls), get);
        res = hazard::resolve_intensities(params, sel.rlzs, get);
        for (std::size_t g = 0; g < store.num_groups(); ++g)
            rbg.push_back(store.rlzs_by_gsim(g));
    }

    hazard::TaskInputs inputs() const
    {
        return hazard::TaskInputs{params, edges, store.sites(), sel.rlzs, res.iml3,
                                  res.ok_sites, rbg, gmms};
    }

    ReduceShape reduce_shape() const
    {
        ReduceShape r;
        r.M = params.imtls.size();
        r.N = store.sites().size();
        r.T = shape.trt;
        r.Ma = shape.mag;
        return r;
    }
};

} // namespace

TEST_CASE("reduce_to_root combines probabilities of all ranks", "[mpi][reduce]")
{
    int rank = 0, size = 1;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    ReduceShape shape;
    shape.M = 1;
    shape.N = 2;
    shape.T = 1;
    shape.Ma = 2;
    shape.shape6 = {1, 1, 1, 1, 1, 2};

    hazard::Accumulator local;
    hazard::NdArray shared(shape.shape6, 0.1 * (rank + 1));
    local.add({0, 0}, {0, 1}, shared);
    if (rank == size - 1)
        local.add({0, 1}, {0, 0}, hazard::NdArray(shape.shape6, 0.3));

    const auto out = reduce_to_root(std::move(local), shape, MPI_COMM_WORLD);
    if (rank != 0)
    {
        CHECK(out.empty());
        return;
    }

    double none = 1.0;
    for (int r = 0; r < size; ++r)
        none *= 1.0 - 0.1 * (r + 1);
    REQUIRE(out.num_matrices() == 2);
    const auto& a = out.results().at({0, 0}).at({0, 1});
    for (std::size_t i = 0; i < a.size(); ++i)
        CHECK(a[i] == Approx(1.0 - none));
    const auto& b = out.results().at({0, 1}).at({0, 0});
    CHECK(b[0] == Approx(0.3));
}

TEST_CASE("the task farm over several ranks matches a serial run", "[mpi][farm]")
{
    int rank = 0;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);

    const Prepared prep;
    const auto in = prep.inputs();
    const auto tasks = build_tasks(prep.store, prep.edges.mag, 1, 1);

    hazard::Accumulator serial;
    for (const auto& t : tasks)
    {
        auto reader = prep.store.open_reader();
        serial.add(hazard::compute_disagg(t, in, *reader));
    }

    RunContext rc{};
    MPI_Comm_size(MPI_COMM_WORLD, &rc.world_size);
    rc.world_rank = rank;
    TaskFarm farm(rc, prep.store);

    // P and Z of the partial results
    auto shape = prep.reduce_shape();
    const auto& any = serial.results().begin()->second.begin()->second;
    shape.shape6 = any.shape();

    const auto acc = farm.run(tasks, in, shape);
    if (rank != 0)
    {
        CHECK(acc.empty());
        return;
    }
    REQUIRE(acc.num_matrices() == serial.num_matrices());
    for (const auto& [key, mats] : serial.results())
        for (const auto& [bin, mat] : mats)
        {
            const auto& got = acc.results().at(key).at(bin);
            REQUIRE(got.size() == mat.size());
            for (std::size_t i = 0; i < mat.size(); ++i)
                CHECK(got[i] == Approx(mat[i]).margin(1e-15));
        }
}

TEST_CASE("a task failure on one rank fails every rank", "[mpi][farm]")
{
    Prepared prep;
    prep.gmms["C"] = std::make_shared<fixture::BrokenGmm>();
    const auto tasks = build_tasks(prep.store, prep.edges.mag, 1, 1);

    RunContext rc{};
    TaskFarm farm(rc, prep.store);
    REQUIRE_THROWS_AS(farm.run_local(tasks, prep.inputs()), std::runtime_error);
}
