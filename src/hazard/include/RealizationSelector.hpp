#pragma once
#include "Imt.hpp"
#include "NdArray.hpp"
#include "Params.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <vector>

/**
 * @file RealizationSelector.hpp
 * @brief Choice of the Z realizations disaggregated at each site.
 *
 * @details
 * @rst
 * - ``rlz_index`` set: the same indices for every site.
 * - otherwise ``Z = num_rlzs_disagg``; with more than one realization the per-site ranking is
 *   the Euclidean distance between ``log(max(curve, 1e-12))`` and the log of the weighted mean
 *   curve, and the ``Z`` closest are kept. A single-realization model selects ``0``.
 * @endrst
 */

namespace hazard
{

class RlzMatrix
{
  public:
    RlzMatrix() = default;
    RlzMatrix(std::size_t N, std::size_t Z) : N_(N), Z_(Z), ids_(N * Z, 0) {}

    std::size_t N() const noexcept { return N_; }
    std::size_t Z() const noexcept { return Z_; }
    int& operator()(std::size_t s, std::size_t z) { return ids_.at(s * Z_ + z); }
    int operator()(std::size_t s, std::size_t z) const { return ids_.at(s * Z_ + z); }
    std::span<const int> row(std::size_t s) const
    {
        return std::span<const int>(ids_).subspan(s * Z_, Z_);
    }
    const std::vector<int>& ids() const noexcept { return ids_; }

  private:
    std::size_t N_ = 0, Z_ = 0;
    std::vector<int> ids_;
};

struct RlzSelection
{
    RlzMatrix rlzs;
    bool by_closeness = false; // persisted as best_rlzs when true
};

using CurveGetter = std::function<std::optional<std::vector<double>>(int sid, int rlz)>;

// Weighted mean of R flattened curves; per-IMT weights from the (R, M) matrix
std::vector<double> mean_curve(const std::vector<std::vector<double>>& curves,
                               const NdArray& weights, const Imtls& imtls);

// Indices of `curves` sorted by log-distance to `ref` (stable on ties)
std::vector<std::size_t> closest_to_ref(const std::vector<std::vector<double>>& curves,
                                        std::span<const double> ref, double cutoff = 1e-12);

RlzSelection select_realizations(const CalcParams& params, std::size_t N, std::size_t R,
                                 const NdArray& weights, const CurveGetter& get_curve);

} // namespace hazard
