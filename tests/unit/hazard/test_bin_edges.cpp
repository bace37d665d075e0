#include "BinEdges.hpp"
#include "Errors.hpp"
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <cmath>
#include <limits>
#include <vector>

using namespace hazard;
using Catch::Approx;
using Catch::Matchers::ContainsSubstring;

static CalcParams basic_params()
{
    CalcParams p;
    p.imtls.add("PGA", {0.01, 0.1, 1.0});
    p.poes_disagg = {0.1};
    return p;
}

static SiteCollection two_sites()
{
    return SiteCollection({{0, 0.0, 0.0, 760.0}, {1, 10.0, 45.0, 400.0}});
}

TEST_CASE("magnitude edges cover the observed range", "[hazard][bins]")
{
    const auto e = mag_edges(5.0, 6.8, 0.5);
    REQUIRE(e.size() == 5);
    CHECK(e.front() == Approx(5.0));
    CHECK(e.back() == Approx(7.0));

    // a single magnitude still gives one bin
    const auto one = mag_edges(5.0, 5.0, 0.5);
    REQUIRE(one.size() == 2);
    CHECK(one[1] == Approx(5.5));

    // the maximum on an edge opens one more bin
    const auto top = mag_edges(5.0, 7.0, 0.5);
    CHECK(top.back() == Approx(7.5));
}

TEST_CASE("distance and epsilon edges", "[hazard][bins]")
{
    const auto d = dist_edges(200.0, 10.0);
    REQUIRE(d.size() == 21);
    CHECK(d.front() == 0.0);
    CHECK(d.back() == Approx(200.0));

    const auto e = eps_edges(3.0, 3);
    REQUIRE(e.size() == 4);
    CHECK(e[0] == Approx(-3.0));
    CHECK(e[1] == Approx(-1.0));
    CHECK(e[2] == Approx(1.0));
    CHECK(e[3] == Approx(3.0));
}

TEST_CASE("lon/lat bins are centred on the site", "[hazard][bins]")
{
    auto [lons, lats] = lon_lat_bins(0.0, 0.0, 200.0, 1.0);
    REQUIRE(lons.size() == 5); // 2n bins with n = ceil(200 km in degrees / 1)
    REQUIRE(lats.size() == 5);
    CHECK(lats[2] == Approx(0.0).margin(1e-12));
    CHECK(lats.back() == Approx(200.0 * KM_TO_DEGREES));
    CHECK(lons.back() == Approx(lats.back())); // cos(0) = 1

    // longitudes widen away from the equator
    auto [lons60, lats60] = lon_lat_bins(0.0, 60.0, 200.0, 1.0);
    CHECK(lons60.back() == Approx(2.0 * (lats60.back() - 60.0)));
}

TEST_CASE("bin_index follows [lo, hi) with the last edge inclusive", "[hazard][bins]")
{
    const std::vector<double> edges{0.0, 10.0, 20.0};
    CHECK(bin_index(edges, 0.0) == 0u);
    CHECK(bin_index(edges, 9.99) == 0u);
    CHECK(bin_index(edges, 10.0) == 1u);
    CHECK(bin_index(edges, 20.0) == 1u);
    CHECK_FALSE(bin_index(edges, 20.01).has_value());
    CHECK_FALSE(bin_index(edges, -0.5).has_value());
    CHECK_FALSE(bin_index(edges, std::numeric_limits<double>::quiet_NaN()).has_value());

    const std::vector<double> lons{179.0, 180.0, 181.0};
    CHECK(lon_bin_index(lons, -179.5) == 1u); // across the date line
}

TEST_CASE("site limits", "[hazard][bins]")
{
    REQUIRE_NOTHROW(check_site_count(10, 10));
    REQUIRE_THROWS_AS(check_site_count(11, 10), ConfigError);
    REQUIRE_THROWS_AS(check_site_count(kMaxSites, kMaxSites + 10), ConfigError);
}

TEST_CASE("build_bin_edges derives every axis", "[hazard][bins]")
{
    const auto p = basic_params();
    const MagsByTrt mags{{"Active Shallow Crust", {5.2, 6.7}}};
    auto [b, s] = build_bin_edges(p, two_sites(), mags, false);

    CHECK(s.trt == 1);
    CHECK(s.mag == 4);  // 5.0 .. 7.0 by 0.5
    CHECK(s.dist == 20);
    CHECK(s.lon == 4);
    CHECK(s.lat == 4);
    CHECK(s.eps == 1);
    CHECK(s.N == 2);
    REQUIRE(b.lons.size() == 2);
    CHECK(b.lats[1][2] == Approx(45.0));
    CHECK(b.trts == std::vector<std::string>{"Active Shallow Crust"});
    CHECK(s.get("dist") == 20);
    REQUIRE_THROWS(s.get("foo"));
}

TEST_CASE("explicit edges override the widths", "[hazard][bins]")
{
    auto p = basic_params();
    p.mag_edges = std::vector<double>{4.0, 6.0, 8.0};
    p.dist_edges = std::vector<double>{0.0, 50.0, 100.0, 300.0};
    const MagsByTrt mags{{"Stable Continental", {5.5}}};
    auto [b, s] = build_bin_edges(p, two_sites(), mags, false);
    CHECK(s.mag == 2);
    CHECK(s.dist == 3);
    CHECK(b.dist.back() == 300.0);
}

TEST_CASE("build_bin_edges rejects unsupported inputs", "[hazard][bins]")
{
    auto p = basic_params();
    const MagsByTrt mags{{"Active Shallow Crust", {5.2, 6.7}}};

    REQUIRE_THROWS_AS(build_bin_edges(p, two_sites(), mags, true), ConfigError);
    REQUIRE_THROWS_AS(build_bin_edges(p, two_sites(), MagsByTrt{}, false), DataError);

    p.coordinate_bin_width = 0.01; // 360 x 360 coordinate bins
    REQUIRE_THROWS_AS(build_bin_edges(p, two_sites(), mags, false), ConfigError);
    REQUIRE_THROWS_WITH(build_bin_edges(p, two_sites(), mags, false),
                        ContainsSubstring("elements): fix the binning!"));
}

TEST_CASE("oversized matrices report their element count", "[hazard][bins]")
{
    ShapeDic s;
    s.trt = 1;
    s.mag = s.dist = s.lon = s.lat = 10;
    s.eps = 100;
    REQUIRE_NOTHROW(check_matrix_size(s)); // exactly 1e6 is allowed

    s.trt = 2;
    s.eps = 101;
    REQUIRE_THROWS_AS(check_matrix_size(s), ConfigError);
    REQUIRE_THROWS_WITH(check_matrix_size(s), ContainsSubstring("(2020000 elements)"));
}
