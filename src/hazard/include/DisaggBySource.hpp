#pragma once
#include "IntensityResolver.hpp"
#include "Params.hpp"
#include "RealizationSelector.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

/**
 * @file DisaggBySource.hpp
 * @brief Contribution of each source group to the PoE at the disaggregation intensity.
 *
 * @details
 * Experimental. For each site the first selected realization is used: the per-group curve of
 * every source group is interpolated at the IML of each (IMT, poe). Records whose contributions
 * are all zero are dropped.
 */

namespace hazard
{

struct BySourceRecord
{
    std::string path; // disagg_by_src/<poe-P|iml-I>-<imt>-sid-<s>
    int site_id = 0;
    int rlz = 0;
    std::string imt;
    std::vector<double> poes; // one per source group
    double poe_agg = 0.0;
};

using GroupCurveGetter =
    std::function<std::optional<std::vector<double>>(int sid, int rlz, std::size_t gidx)>;

std::vector<BySourceRecord> disagg_by_source(const CalcParams& params, const RlzMatrix& rlzs,
                                             const std::vector<Iml3>& iml3,
                                             std::size_t num_groups,
                                             const GroupCurveGetter& get_group_curve);

} // namespace hazard
