#pragma once
#include "NdArray.hpp"
#include <initializer_list>
#include <span>

/**
 * @file Probability.hpp
 * @brief Independent-events combination of probabilities of exceedance.
 *
 * @details
 * Contributions of independent rupture batches are combined with
 * ``1 - (1 - p_a) * (1 - p_b)``; the operation is commutative and associative and has 0 as
 * identity, so partial results can be folded in any order.
 */

namespace hazard
{

inline double agg_probs(double a, double b) noexcept
{
    return 1.0 - (1.0 - a) * (1.0 - b);
}

// 1 - (1 - p1) ... (1 - pn)
double agg_probs(std::initializer_list<double> probs) noexcept;

// acc <- 1 - (1 - acc) * (1 - probs), element-wise; sizes must match
void agg_probs_inplace(std::span<double> acc, std::span<const double> probs);

NdArray agg_probs(const NdArray& a, const NdArray& b);

// Aggregate PoE implied by a set of cells: 1 - prod(1 - p)
double poe_agg(std::span<const double> probs) noexcept;

} // namespace hazard
