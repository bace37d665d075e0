#pragma once
#include "BinEdges.hpp"
#include "DisaggBySource.hpp"
#include "PmfExtractor.hpp"
#include "RealizationSelector.hpp"
#include "master/io/IWriter.hpp"
#include <vector>

/**
 * @file Outputs.hpp
 * @brief Layout of the disaggregation results in the output file.
 *
 * @details
 * @rst
 * .. code-block:: text
 *
 *    disagg-bins/mags, dists, eps            bin edges
 *    disagg-bins/lons/sid-<s>, lats/sid-<s>  per-site coordinate edges
 *    best_rlzs                               (N, Z) int, when chosen by closeness
 *    disagg                                  group, attribute trts
 *    disagg/<rlz-R->IMT-sid-S-poe-K/<PMF>    one dataset per PMF, attribute poe_agg
 *    disagg_by_src/<poe-P|iml-I>-IMT-sid-S   per-group PoEs, attributes poe_agg, rlzi
 *
 * Every PMF group carries ``site_id``, ``rlzi`` (id or ``"mean"``), ``imt``, ``iml``
 * (realizations only), the five ``*_bin_edges``, ``trt_bin_edges``, ``location``,
 * ``poe_agg`` (one per PMF) and ``poe`` when a target PoE was given.
 * @endrst
 */

namespace disagg::master
{

void save_bin_edges(io::IWriter& w, const hazard::BinEdges& edges);

void save_best_rlzs(io::IWriter& w, const hazard::RlzMatrix& rlzs);

void save_by_source(io::IWriter& w, const std::vector<hazard::BySourceRecord>& recs);

void save_pmf_groups(io::IWriter& w, const std::vector<hazard::PmfGroup>& groups,
                     const hazard::BinEdges& edges);

} // namespace disagg::master
