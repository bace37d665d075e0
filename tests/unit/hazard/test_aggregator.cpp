#include "Aggregator.hpp"
#include "Probability.hpp"
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <stdexcept>

using namespace hazard;
using Catch::Approx;

namespace
{

PartialResult partial(std::size_t trti, std::size_t magi, int sid, double value)
{
    PartialResult r;
    r.trti = trti;
    r.magi = magi;
    r.imti = 0;
    r.by_site.emplace(sid, NdArray({1, 1, 1, 1, 1, 1}, value));
    return r;
}

} // namespace

TEST_CASE("partial results of the same bin are combined", "[hazard][agg]")
{
    Accumulator acc;
    acc.add(partial(0, 1, 3, 0.1));
    acc.add(partial(0, 1, 3, 0.2));
    acc.add(partial(1, 0, 3, 0.4));
    acc.add(partial(0, 1, 4, 0.5));

    REQUIRE(acc.results().size() == 2);
    CHECK(acc.num_matrices() == 3);
    const auto& mats = acc.results().at({0, 3});
    CHECK(mats.at({0, 1})[0] == Approx(agg_probs(0.1, 0.2)));
    CHECK(mats.at({1, 0})[0] == Approx(0.4));
}

TEST_CASE("the order of partial results does not matter", "[hazard][agg]")
{
    Accumulator a, b;
    a.add(partial(0, 0, 0, 0.1));
    a.add(partial(0, 0, 0, 0.3));
    a.add(partial(0, 0, 0, 0.7));
    b.add(partial(0, 0, 0, 0.7));
    b.add(partial(0, 0, 0, 0.1));
    b.add(partial(0, 0, 0, 0.3));
    CHECK(a.results().at({0, 0}).at({0, 0})[0] ==
          Approx(b.results().at({0, 0}).at({0, 0})[0]));
}

TEST_CASE("missing bins are zero in the 8-D matrix", "[hazard][agg]")
{
    Accumulator acc;
    acc.add(partial(1, 2, 0, 0.25));
    const auto out = assemble(acc, 2, 3);
    REQUIRE(out.size() == 1);
    const auto& m8 = out.at({0, 0});
    REQUIRE(m8.shape() == NdArray::Shape{2, 3, 1, 1, 1, 1, 1, 1});
    CHECK(m8.at({1, 2, 0, 0, 0, 0, 0, 0}) == 0.25);
    CHECK(m8.sum() == Approx(0.25));

    REQUIRE_THROWS_AS(assemble(acc, 1, 3), std::out_of_range);
}
