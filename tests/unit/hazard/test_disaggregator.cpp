#include "Disaggregator.hpp"
#include "Errors.hpp"
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <memory>

using namespace hazard;
using Catch::Approx;

namespace
{

// Median of 0.1 g for every rupture, unit log-sigma
class StubGmm final : public IGroundMotionModel
{
  public:
    const char* name() const override { return "stub"; }
    MeanStd mean_std(const RuptureContext&, const Imt&) const override
    {
        return {std::log(0.1), 1.0};
    }
};

class TableReader final : public IRuptureReader
{
  public:
    explicit TableReader(RuptureColumns cols) : cols_(std::move(cols)) {}

    RuptureColumns read(std::span<const std::size_t> idxs) override
    {
        RuptureColumns out;
        for (const auto& [name, col] : cols_)
        {
            Column c;
            c.ncols = col.ncols;
            for (std::size_t i : idxs)
                for (std::size_t k = 0; k < col.ncols; ++k)
                    c.values.push_back(col.at(i, k));
            out.emplace(name, std::move(c));
        }
        return out;
    }

  private:
    RuptureColumns cols_;
};

RuptureContext ctx_at(double rrup, double lon, double lat, double rate)
{
    RuptureContext c;
    c.mag = 6.0;
    c.rrup = rrup;
    c.rjb = rrup;
    c.lon = lon;
    c.lat = lat;
    c.occurrence_rate = rate;
    c.tom = PoissonTOM{50.0};
    return c;
}

RuptureColumns three_ruptures()
{
    RuptureColumns cols;
    cols["mag"] = Column{{5.5, 5.5, 5.5}, 1};
    cols["rake"] = Column{{0.0, 90.0, 0.0}, 1};
    cols["hypo_depth"] = Column{{10.0, 10.0, 10.0}, 1};
    cols["occurrence_rate"] = Column{{0.01, 0.01, 0.01}, 1};
    cols["rrup_"] = Column{{50.0, 150.0, 250.0}, 1};
    cols["rjb_"] = Column{{50.0, 150.0, 250.0}, 1};
    cols["lon_"] = Column{{0.5, -0.5, 0.5}, 1};
    cols["lat_"] = Column{{0.5, 0.5, 0.5}, 1};
    return cols;
}

} // namespace

TEST_CASE("probability of no exceedance per epsilon band", "[hazard][disagg]")
{
    const StubGmm gmm;
    const EpsilonBins eps(3.0, eps_edges(3.0, 2));
    const ZsByGsim zs{{&gmm, {0}}};

    NdArray iml2({2, 1});
    iml2.at({0, 0}) = 0.1; // at the median: lvl = 0
    iml2.at({1, 0}) = std::nan("");

    const auto d = disaggregate({ctx_at(30.0, 0.1, 0.2, 0.01)}, zs, Imt::parse("PGA"), iml2, eps);
    REQUIRE(d.pnes.shape() == NdArray::Shape{1, 2, 2, 1});
    CHECK(d.dists == std::vector<double>{30.0});
    // lower band is below the level, upper band carries sf(0) = 0.5
    CHECK(d.pnes.at({0, 0, 0, 0}) == Approx(1.0));
    CHECK(d.pnes.at({0, 1, 0, 0}) == Approx(std::exp(-0.01 * 50.0 * 0.5)));
    // missing intensities leave pne at 1
    CHECK(d.pnes.at({0, 0, 1, 0}) == 1.0);
    CHECK(d.pnes.at({0, 1, 1, 0}) == 1.0);
}

TEST_CASE("ruptures in the same cell combine as independent events", "[hazard][disagg]")
{
    DisaggData d;
    d.dists = {5.0, 7.0, 500.0};
    d.lons = {0.5, 0.6, 0.5};
    d.lats = {0.5, 0.5, 0.5};
    d.pnes = NdArray({3, 1, 1, 1});
    d.pnes[0] = 0.9;
    d.pnes[1] = 0.8;
    d.pnes[2] = 0.1; // out of the distance bins

    const std::vector<double> dist{0.0, 10.0, 20.0};
    const std::vector<double> ll{-1.0, 0.0, 1.0};
    const auto mat = build_disagg_matrix(d, dist, ll, ll);
    REQUIRE(mat.shape() == NdArray::Shape{2, 2, 2, 1, 1, 1});
    CHECK(mat.at({0, 1, 1, 0, 0, 0}) == Approx(1.0 - 0.9 * 0.8));
    CHECK(mat.sum() == Approx(1.0 - 0.9 * 0.8));
}

TEST_CASE("longitudes across the date line fall in the site's bins", "[hazard][disagg]")
{
    DisaggData d;
    d.dists = {5.0};
    d.lons = {-179.5};
    d.lats = {0.5};
    d.pnes = NdArray({1, 1, 1, 1}, 0.5);

    const std::vector<double> dist{0.0, 10.0};
    const std::vector<double> lons{179.0, 180.0, 181.0};
    const std::vector<double> lats{0.0, 1.0};
    const auto mat = build_disagg_matrix(d, dist, lons, lats);
    CHECK(mat.at({0, 1, 0, 0, 0, 0}) == Approx(0.5));
}

namespace
{

struct Fixture
{
    CalcParams params;
    BinEdges edges;
    SiteCollection sites{std::vector<Site>{Site{0, 0.0, 0.0, 760.0}}};
    RlzMatrix rlzs{1, 1};
    std::vector<Iml3> iml3;
    std::vector<int> ok_sites{0};
    std::vector<RlzsByGsim> rlzs_by_gsim{RlzsByGsim{{"stub", {0}}}};
    GmmsByName gmms{{"stub", std::make_shared<StubGmm>()}};

    Fixture()
    {
        params.imtls.add("PGA", {0.05, 0.1});
        params.poes_disagg = {0.1};
        params.maximum_distance.default_km = 200.0;
        edges.mag = {5.0, 6.0};
        edges.dist = {0.0, 100.0, 200.0};
        edges.lons = {{-2.0, 0.0, 2.0}};
        edges.lats = {{-2.0, 0.0, 2.0}};
        edges.eps = {-3.0, 3.0};
        edges.trts = {"Active Shallow Crust"};
        iml3.push_back(Iml3{NdArray({1, 1, 1}, 0.1), Imt::parse("PGA"), 0});
    }

    TaskInputs inputs() const
    {
        return TaskInputs{params, edges, sites, rlzs, iml3, ok_sites, rlzs_by_gsim, gmms};
    }
};

} // namespace

TEST_CASE("a task bins the ruptures within the maximum distance", "[hazard][disagg]")
{
    Fixture f;
    TableReader reader(three_ruptures());
    const TaskSpec task{0, 0, 0, 0, {0, 1, 2}};
    const auto res = compute_disagg(task, f.inputs(), reader);

    REQUIRE(res.by_site.count(0) == 1);
    const auto& mat = res.by_site.at(0);
    REQUIRE(mat.shape() == NdArray::Shape{2, 2, 2, 1, 1, 1});
    const double p = 1.0 - std::exp(-0.01 * 50.0 * 0.5);
    CHECK(mat.at({0, 1, 1, 0, 0, 0}) == Approx(p));
    CHECK(mat.at({1, 0, 1, 0, 0, 0}) == Approx(p));
    CHECK(mat.sum() == Approx(2.0 * p));
}

TEST_CASE("a site beyond every rupture emits nothing", "[hazard][disagg]")
{
    Fixture f;
    f.params.maximum_distance.default_km = 10.0;
    TableReader reader(three_ruptures());
    const auto res = compute_disagg(TaskSpec{0, 0, 0, 0, {0, 1, 2}}, f.inputs(), reader);
    CHECK(res.by_site.empty());
}

TEST_CASE("task input errors", "[hazard][disagg]")
{
    Fixture f;
    const TaskSpec task{0, 0, 0, 0, {0}};

    SECTION("missing ground-motion model")
    {
        f.gmms.clear();
        TableReader reader(three_ruptures());
        REQUIRE_THROWS_AS(compute_disagg(task, f.inputs(), reader), ConfigError);
    }
    SECTION("missing distance column")
    {
        auto cols = three_ruptures();
        cols.erase("rrup_");
        TableReader reader(cols);
        REQUIRE_THROWS_AS(compute_disagg(task, f.inputs(), reader), ConfigError);
    }
    SECTION("unexpected column")
    {
        auto cols = three_ruptures();
        cols["width"] = Column{{1.0, 1.0, 1.0}, 1};
        TableReader reader(cols);
        REQUIRE_THROWS_AS(compute_disagg(task, f.inputs(), reader), ConfigError);
    }
}
