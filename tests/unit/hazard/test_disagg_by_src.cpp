#include "DisaggBySource.hpp"
#include "Errors.hpp"
#include "Probability.hpp"
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <cmath>
#include <cstdio>
#include <functional>
#include <string>
#include <unistd.h>

using namespace hazard;
using Catch::Approx;
using Catch::Matchers::ContainsSubstring;

namespace
{

std::optional<std::vector<double>> group_curve(int, int, std::size_t g)
{
    if (g == 0)
        return std::vector<double>{0.2, 0.08, 0.01};
    if (g == 1)
        return std::vector<double>{0.05, 0.02, 0.001};
    return std::nullopt;
}

std::vector<Iml3> pga_at(double iml)
{
    std::vector<Iml3> out;
    out.push_back(Iml3{NdArray({1, 1, 1}, iml), Imt::parse("PGA"), 0});
    return out;
}

// Everything written to stderr while `fn` runs
std::string stderr_of(const std::function<void()>& fn)
{
    std::FILE* tmp = std::tmpfile();
    REQUIRE(tmp != nullptr);
    std::fflush(stderr);
    const int saved = ::dup(STDERR_FILENO);
    ::dup2(::fileno(tmp), STDERR_FILENO);
    fn();
    std::fflush(stderr);
    ::dup2(saved, STDERR_FILENO);
    ::close(saved);

    std::string out;
    std::rewind(tmp);
    char buf[256];
    while (std::fgets(buf, sizeof buf, tmp))
        out += buf;
    std::fclose(tmp);
    return out;
}

} // namespace

TEST_CASE("each source group contributes its own exceedance probability", "[hazard][bysrc]")
{
    CalcParams p;
    p.imtls.add("PGA", {0.1, 0.2, 0.4});
    p.poes_disagg = {0.1};
    const RlzMatrix rlzs(1, 1);

    const auto recs = disagg_by_source(p, rlzs, pga_at(0.2), 3, group_curve);
    REQUIRE(recs.size() == 1);
    const auto& r = recs[0];
    CHECK(r.path == "disagg_by_src/poe-0.1-PGA-sid-0");
    CHECK(r.rlz == 0);
    REQUIRE(r.poes.size() == 3);
    CHECK(r.poes[0] == Approx(0.08));
    CHECK(r.poes[1] == Approx(0.02));
    CHECK(r.poes[2] == 0.0);
    CHECK(r.poe_agg == Approx(1.0 - 0.92 * 0.98));
}

TEST_CASE("fixed intensities are labelled by level", "[hazard][bysrc]")
{
    CalcParams p;
    p.imtls.add("PGA", {0.1, 0.2, 0.4});
    p.iml_disagg = {{"PGA", 0.2}};
    const RlzMatrix rlzs(1, 1);

    const auto recs = disagg_by_source(p, rlzs, pga_at(0.2), 2, group_curve);
    REQUIRE(recs.size() == 1);
    CHECK(recs[0].path == "disagg_by_src/iml-0.2-PGA-sid-0");
}

TEST_CASE("sites without intensity produce no record", "[hazard][bysrc]")
{
    CalcParams p;
    p.imtls.add("PGA", {0.1, 0.2, 0.4});
    p.poes_disagg = {0.1};
    const RlzMatrix rlzs(1, 1);
    CHECK(disagg_by_source(p, rlzs, pga_at(std::nan("")), 2, group_curve).empty());
}

TEST_CASE("group curves must match the configured levels", "[hazard][bysrc]")
{
    CalcParams p;
    p.imtls.add("PGA", {0.1, 0.2});
    p.poes_disagg = {0.1};
    const RlzMatrix rlzs(1, 1);
    REQUIRE_THROWS_AS(disagg_by_source(p, rlzs, pga_at(0.2), 1, group_curve), DataError);
}

TEST_CASE("a poe_agg far from the target poe is reported with its site and IMT",
          "[hazard][bysrc]")
{
    CalcParams p;
    p.imtls.add("PGA", {0.1, 0.2, 0.4});
    p.poes_disagg = {0.5};
    const RlzMatrix rlzs(1, 1);

    std::vector<BySourceRecord> recs;
    const auto err =
        stderr_of([&] { recs = disagg_by_source(p, rlzs, pga_at(0.2), 3, group_curve); });
    REQUIRE(recs.size() == 1);
    CHECK(recs[0].poe_agg == Approx(1.0 - 0.92 * 0.98));
    CHECK_THAT(err, ContainsSubstring("Site #0, IMT=PGA: poe_agg="));
    CHECK_THAT(err, ContainsSubstring("expected poe=0.5"));
}
