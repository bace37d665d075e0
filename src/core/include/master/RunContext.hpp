#pragma once

/**
 * @file RunContext.hpp
 * @brief Runtime handles shared by the calculator, the task farm and the plugins.
 *
 * @details
 * The communicator is stored boxed (see ``MpiBox.hpp``) so headers that only pass the
 * context around do not need ``mpi.h``. ``num_threads`` is the OpenMP team size used by the
 * task farm; 0 means the OpenMP default.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   disagg::master::RunContext rc{};
 *   rc.mpi_comm = mpi_box(MPI_COMM_WORLD);
 *   MPI_Comm_rank(MPI_COMM_WORLD, &rc.world_rank);
 *   MPI_Comm_size(MPI_COMM_WORLD, &rc.world_size);
 * @endrst
 */

namespace disagg::master
{

struct RunContext
{
    void* mpi_comm{nullptr}; // boxed MPI_Comm*, nullptr = MPI_COMM_WORLD
    int world_rank{0};
    int world_size{1};
    int num_threads{0};
};

} // namespace disagg::master
