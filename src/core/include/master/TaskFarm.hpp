#pragma once
#include "Aggregator.hpp"
#include "Disaggregator.hpp"
#include "RuptureStore.hpp"
#include "master/Reduce.hpp"
#include <cstddef>
#include <span>
#include <vector>

/**
 * @file TaskFarm.hpp
 * @brief Splits the ruptures into tasks and runs them over MPI ranks and OpenMP threads.
 *
 * @details
 * Rupture indices are grouped by ``(source group, magnitude bin)`` and cut in blocks; every
 * block becomes one task per IMT. Tasks are dealt round-robin to the ranks; inside a rank an
 * OpenMP loop executes them and pushes each :cpp:struct:`hazard::PartialResult` into a queue
 * drained by a single reducer thread that owns the :cpp:class:`hazard::Accumulator`.
 *
 * @rst
 * .. graphviz::
 *
 *    digraph F {
 *      rankdir=LR;
 *      node [shape=box];
 *      tasks [label="build_tasks()"];
 *      omp [label="omp for: compute_disagg()"];
 *      queue [label="ResultQueue"];
 *      red [label="reducer thread: Accumulator::add()"];
 *      mpi [label="reduce_to_root()"];
 *      tasks -> omp -> queue -> red -> mpi;
 *    }
 * @endrst
 *
 * A task that throws stops the farm: the remaining tasks are skipped, every rank learns of the
 * failure through an ``MPI_Allreduce`` and the first exception is rethrown. Nothing is retried.
 */

namespace disagg::master
{

struct RunContext;

// ceil(U / concurrent_tasks * M), at least 1
std::size_t task_blocksize(std::size_t U, std::size_t concurrent_tasks, std::size_t M);

/**
 * @brief One task per (group, magnitude bin, block, IMT), in that nesting order.
 * @details Ruptures whose magnitude is outside `mag_edges` are left out.
 */
std::vector<hazard::TaskSpec> build_tasks(const hazard::IRuptureStore& store,
                                          std::span<const double> mag_edges,
                                          std::size_t num_imts, std::size_t blocksize);

class TaskFarm
{
  public:
    struct Options
    {
        std::size_t max_queue = 0; // 0 = unbounded
    };

    TaskFarm(const RunContext& rc, const hazard::IRuptureStore& store);
    TaskFarm(const RunContext& rc, const hazard::IRuptureStore& store, Options o);

    // Runs this rank's share; throws the first task failure of any rank
    hazard::Accumulator run_local(const std::vector<hazard::TaskSpec>& tasks,
                                  const hazard::TaskInputs& in);

    // run_local() followed by the cross-rank reduction (result on rank 0)
    hazard::Accumulator run(const std::vector<hazard::TaskSpec>& tasks,
                            const hazard::TaskInputs& in, const ReduceShape& shape);

  private:
    const RunContext& rc_;
    const hazard::IRuptureStore& store_;
    Options opt_;
};

} // namespace disagg::master
