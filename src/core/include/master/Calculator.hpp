#pragma once
#include "Aggregator.hpp"
#include "BinEdges.hpp"
#include "DisaggBySource.hpp"
#include "Disaggregator.hpp"
#include "IntensityResolver.hpp"
#include "Params.hpp"
#include "PmfExtractor.hpp"
#include "RealizationSelector.hpp"
#include "RuptureStore.hpp"
#include "master/RunContext.hpp"
#include "master/io/IWriter.hpp"
#include <cstddef>
#include <string>
#include <vector>

/**
 * @file Calculator.hpp
 * @brief Drives a disaggregation run from a rupture store to the written PMFs.
 *
 * @details
 * Typical usage:
 *
 * @rst
 * .. code-block:: cpp
 *
 *   disagg::master::RunContext rc{};
 *   auto store = disagg::store::Hdf5RuptureStore::open("model.h5");
 *   auto gmms  = host.make_gmms(cfg.gmms, rc);
 *   disagg::master::io::Hdf5Writer writer(cfg.io);
 *
 *   disagg::master::Calculator calc(rc, cfg.calc, *store, gmms, writer, cfg.case_name);
 *   calc.run();
 *
 * Phases:
 *
 * - ``init``: site limits.
 * - ``execute``: bin edges, realizations, intensities, tasks, preflight, task farm.
 * - ``post_execute``: 8-D matrices, PMFs; rank 0 writes every output.
 *
 * All ranks execute ``init`` and ``execute``; only rank 0 opens the writer, after the task
 * farm has succeeded, so a failed run leaves no output behind.
 * @endrst
 */

namespace disagg::master
{

class Calculator
{
  public:
    Calculator(const RunContext& rc, const hazard::CalcParams& params,
               const hazard::IRuptureStore& store, hazard::GmmsByName gmms,
               io::IWriter& writer, std::string case_name = "disagg");

    void init();
    hazard::Accumulator execute();
    // PMF groups written on rank 0; empty on the other ranks
    std::vector<hazard::PmfGroup> post_execute(const hazard::Accumulator& results);

    std::vector<hazard::PmfGroup> run();

    const hazard::BinEdges& bin_edges() const noexcept { return edges_; }
    const hazard::ShapeDic& shape() const noexcept { return shape_; }
    const hazard::RlzSelection& selection() const noexcept { return selection_; }
    const hazard::ResolvedIntensities& intensities() const noexcept { return resolved_; }
    std::size_t num_tasks() const noexcept { return num_tasks_; }

  private:
    RunContext rc_;
    const hazard::CalcParams& params_;
    const hazard::IRuptureStore& store_;
    hazard::GmmsByName gmms_;
    io::IWriter& writer_;
    std::string case_name_;
    int rank_ = 0;

    hazard::BinEdges edges_;
    hazard::ShapeDic shape_;
    hazard::NdArray weights_;
    hazard::RlzSelection selection_;
    hazard::ResolvedIntensities resolved_;
    std::vector<hazard::RlzsByGsim> rlzs_by_gsim_;
    std::vector<hazard::BySourceRecord> by_src_;
    std::size_t num_tasks_ = 0;

    std::size_t concurrent_tasks_() const;
};

} // namespace disagg::master
