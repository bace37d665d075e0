#pragma once
#include "BinEdges.hpp"
#include "GroundMotion.hpp"
#include "IntensityResolver.hpp"
#include "NdArray.hpp"
#include "Params.hpp"
#include "RealizationSelector.hpp"
#include "RuptureStore.hpp"
#include "TruncNorm.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

/**
 * @file Disaggregator.hpp
 * @brief Per-task computation of the 6-D disaggregation matrices.
 *
 * @details
 * A task is a batch of ruptures of one source group falling in one magnitude bin, evaluated
 * for one IMT. For each ok site the task keeps the ruptures within the maximum distance of
 * the group's TRT, computes the probability of no exceedance of every (rupture, epsilon band,
 * poe, realization), and folds them into a matrix of shape ``(D, Lo, La, E, P, Z)``:
 *
 * @rst
 * .. math::
 *
 *    \mathrm{mat}[d, lo, la] = 1 - \prod_{u \in (d, lo, la)} \mathrm{pne}[u]
 *
 * Ruptures whose distance or closest point falls outside the site's bins are skipped.
 * Sites whose matrix is all zeros are not emitted.
 * @endrst
 *
 * Tasks read their own rupture rows through a private reader and otherwise only touch the
 * read-only :cpp:struct:`hazard::TaskInputs`, so any number of them can run concurrently.
 */

namespace hazard
{

struct TaskSpec
{
    std::size_t gidx = 0;
    std::size_t trti = 0;
    std::size_t magi = 0;
    std::size_t imti = 0;
    std::vector<std::size_t> idxs; // rupture rows
};

struct PartialResult
{
    std::size_t trti = 0;
    std::size_t magi = 0;
    std::size_t imti = 0;
    std::map<int, NdArray> by_site; // sid -> (D, Lo, La, E, P, Z)
};

using GmmsByName = std::map<std::string, std::shared_ptr<const IGroundMotionModel>>;

/// Shared read-only state of all tasks of a run.
struct TaskInputs
{
    const CalcParams& params;
    const BinEdges& edges;
    const SiteCollection& sites;
    const RlzMatrix& rlzs;
    const std::vector<Iml3>& iml3;          // per IMT
    const std::vector<int>& ok_sites;
    const std::vector<RlzsByGsim>& rlzs_by_gsim; // per source group
    const GmmsByName& gmms;
};

/// Raw per-rupture data for one site before binning.
struct DisaggData
{
    std::vector<double> dists;
    std::vector<double> lons;
    std::vector<double> lats;
    NdArray pnes; // (U, E, P, Z)
};

using ZsByGsim = std::vector<std::pair<const IGroundMotionModel*, std::vector<std::size_t>>>;

/**
 * @brief Probabilities of no exceedance for every rupture of one site.
 * @param iml2 (P, Z) intensities of the site; NaN entries produce pne = 1
 */
DisaggData disaggregate(const std::vector<RuptureContext>& ctxs, const ZsByGsim& zs_by_gsim,
                        const Imt& imt, const NdArray& iml2, const EpsilonBins& eps);

NdArray build_disagg_matrix(const DisaggData& data, std::span<const double> dist_edges,
                            std::span<const double> lon_edges, std::span<const double> lat_edges);

PartialResult compute_disagg(const TaskSpec& task, const TaskInputs& in, IRuptureReader& reader);

} // namespace hazard
