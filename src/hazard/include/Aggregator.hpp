#pragma once
#include "Disaggregator.hpp"
#include "NdArray.hpp"
#include <cstddef>
#include <map>
#include <utility>

/**
 * @file Aggregator.hpp
 * @brief Streaming fold of partial results into per-(IMT, site) matrices.
 *
 * @details
 * Matrices for the same ``(imti, sid, trti, magi)`` are combined with
 * ``1 - (1 - before) * (1 - probs)``; the fold is order independent, so results may arrive
 * from any task, thread or rank in any order.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   hazard::Accumulator acc;
 *   for (auto& r : partials) acc.add(std::move(r));
 *   auto mat8 = hazard::assemble(acc, T, Ma);  // (imti, sid) -> (T, Ma, D, Lo, La, E, P, Z)
 * @endrst
 */

namespace hazard
{

class Accumulator
{
  public:
    using Key = std::pair<std::size_t, int>;               // imti, sid
    using BinKey = std::pair<std::size_t, std::size_t>;    // trti, magi
    using Matrices = std::map<BinKey, NdArray>;            // -> (D, Lo, La, E, P, Z)
    using Map = std::map<Key, Matrices>;

    void add(PartialResult&& r);
    void add(const Key& key, const BinKey& bin, const NdArray& probs);

    const Map& results() const noexcept { return acc_; }
    Map& results() noexcept { return acc_; }
    bool empty() const noexcept { return acc_.empty(); }
    std::size_t num_matrices() const noexcept;

  private:
    Map acc_;
};

// 8-D (T, Ma, D, Lo, La, E, P, Z) with zeros for the missing (trti, magi)
NdArray matrix8(const Accumulator::Matrices& mats, std::size_t T, std::size_t Ma);

std::map<Accumulator::Key, NdArray> assemble(const Accumulator& acc, std::size_t T,
                                             std::size_t Ma);

} // namespace hazard
