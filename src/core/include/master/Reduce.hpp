#pragma once
#include "Aggregator.hpp"
#include "NdArray.hpp"
#include <cstddef>
#include <mpi.h>

/**
 * @file Reduce.hpp
 * @brief Cross-rank combination of the per-rank accumulators.
 *
 * @details
 * Every rank holds matrices for an arbitrary subset of ``(imti, sid, trti, magi)``. The union
 * of the keys is agreed with an ``MPI_Allreduce`` (logical OR over a dense flag array); then
 * one ``MPI_Reduce`` onto rank 0 folds the matrices with a commutative user operation
 *
 * @rst
 * .. math::
 *
 *    \mathrm{out} = 1 - (1 - \mathrm{in}) (1 - \mathrm{inout})
 *
 * Missing matrices travel as zeros, which leave the fold unchanged.
 * @endrst
 */

namespace disagg::master
{

struct ReduceShape
{
    std::size_t M = 0, N = 0, T = 0, Ma = 0;
    hazard::NdArray::Shape shape6; // (D, Lo, La, E, P, Z)
};

// Rank 0 gets the combined accumulator, the other ranks an empty one
hazard::Accumulator reduce_to_root(hazard::Accumulator local, const ReduceShape& shape,
                                   MPI_Comm comm);

} // namespace disagg::master
