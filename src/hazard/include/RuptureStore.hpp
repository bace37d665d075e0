#pragma once
#include "BinEdges.hpp"
#include "Imt.hpp"
#include "NdArray.hpp"
#include "Site.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

/**
 * @file RuptureStore.hpp
 * @brief Read-only view of a hazard model: sites, ruptures, logic tree and hazard curves.
 *
 * @details
 * The store is produced by an upstream hazard calculation; this library never writes it.
 * Rupture columns whose name ends in ``_`` are site-dependent and have one column per site
 * (row-major ``[U, N]``); the others have one value per rupture.
 *
 * Every task opens its own :cpp:class:`hazard::IRuptureReader`; readers do not share mutable
 * state with each other or with the store object.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   auto reader = store.open_reader();
 *   std::vector<std::size_t> idxs{4, 5, 9};
 *   hazard::RuptureColumns cols = reader->read(idxs);
 *   double rrup_u0_s2 = cols.at("rrup_").at(0, 2);
 * @endrst
 */

namespace hazard
{

/// Realization ids per ground-motion model, in model order.
using RlzsByGsim = std::vector<std::pair<std::string, std::vector<int>>>;

struct Column
{
    std::vector<double> values; // rows x ncols, row-major
    std::size_t ncols = 1;

    std::size_t rows() const noexcept { return ncols ? values.size() / ncols : 0; }
    double at(std::size_t row, std::size_t col = 0) const { return values.at(row * ncols + col); }
};

using RuptureColumns = std::map<std::string, Column>;

class IRuptureReader
{
  public:
    virtual ~IRuptureReader() = default;
    // Rows `idxs` of every rupture column, in the order given
    virtual RuptureColumns read(std::span<const std::size_t> idxs) = 0;
};

class IRuptureStore
{
  public:
    virtual ~IRuptureStore() = default;

    virtual const SiteCollection& sites() const = 0;
    virtual const std::vector<std::string>& trts() const = 0;
    virtual MagsByTrt mags_by_trt() const = 0;
    virtual bool has_atomic_groups() const = 0;

    // Source groups: TRT index and GMM -> realizations of each group
    virtual std::size_t num_groups() const = 0;
    virtual std::size_t group_trt(std::size_t gidx) const = 0;
    virtual const RlzsByGsim& rlzs_by_gsim(std::size_t gidx) const = 0;

    virtual std::size_t num_rlzs() const = 0;
    // (R, M) weights; a store with scalar weights repeats them for every IMT
    virtual NdArray weights(const Imtls& imtls) const = 0;

    virtual std::size_t num_ruptures() const = 0;
    virtual std::vector<double> rupture_mags() const = 0;
    virtual std::vector<int> rupture_grp_ids() const = 0;

    // Flattened hazard curve (Imtls order); nullopt when the site has none
    virtual std::optional<std::vector<double>> curve(int sid, int rlz) const = 0;
    virtual std::optional<std::vector<double>> group_curve(int sid, int rlz,
                                                           std::size_t gidx) const = 0;

    virtual std::unique_ptr<IRuptureReader> open_reader() const = 0;
};

} // namespace hazard
