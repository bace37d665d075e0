#pragma once
#include "Imt.hpp"
#include "NdArray.hpp"
#include "Params.hpp"
#include "RealizationSelector.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <tuple>
#include <vector>

/**
 * @file IntensityResolver.hpp
 * @brief Intensity levels to disaggregate, per IMT, site, poe and selected realization.
 *
 * @details
 * @rst
 * With ``iml_disagg`` the levels are the fixed ones and ``P == 1``. Otherwise every hazard curve
 * of a selected realization is inverted: its PoEs and levels are reversed (so PoEs increase)
 * and the IML at each ``poes_disagg`` value is interpolated, clamped at the ends of the curve.
 *
 * Sites whose curves cannot reach a requested poe are reported and dropped from ``ok_sites``;
 * their IMLs are set to NaN so no task computes anything for them.
 * @endrst
 */

namespace hazard
{

/// Hazard curves of the selected realizations, [N][Z]; nullopt = no curve.
using Curves = std::vector<std::vector<std::optional<std::vector<double>>>>;

struct Iml3
{
    NdArray iml; // (N, P, Z), NaN = no value
    Imt imt;
    std::size_t imti = 0;
};

/// (sid, rlz, poe index, imti) -> iml
using ImlDic = std::map<std::tuple<int, int, std::size_t, std::size_t>, double>;

struct ResolvedIntensities
{
    std::vector<Iml3> iml3; // one per IMT
    std::vector<int> ok_sites;
    ImlDic imldic;
};

Curves read_curves(const RlzMatrix& rlzs, const Imtls& imtls, const CurveGetter& get_curve);

/**
 * @brief Sites whose curves reach every poe in `poes` for every IMT and selected realization.
 *
 * Sites without any curve are kept. Logs a warning per unreachable (site, rlz, imt, poe).
 * @throws DataError when no site is left.
 */
std::vector<int> check_poes_disagg(const Curves& curves, const RlzMatrix& rlzs,
                                   const Imtls& imtls, const std::vector<double>& poes);

std::vector<Iml3> build_iml3(const RlzMatrix& rlzs, const CalcParams& params,
                             const Curves& curves);

ResolvedIntensities resolve_intensities(const CalcParams& params, const RlzMatrix& rlzs,
                                        const CurveGetter& get_curve);

} // namespace hazard
