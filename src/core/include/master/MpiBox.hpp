#pragma once
#include <mpi.h>

// Boxed communicators keep MPI types out of RunContext.

inline void* mpi_box(MPI_Comm in)
{
    MPI_Comm* p = new MPI_Comm(MPI_COMM_NULL);
    if (in != MPI_COMM_NULL)
        MPI_Comm_dup(in, p);
    return p;
}

// nullptr unboxes to MPI_COMM_WORLD so a default RunContext works in tests
inline MPI_Comm mpi_unbox(const void* p)
{
    return p ? *reinterpret_cast<const MPI_Comm*>(p) : MPI_COMM_WORLD;
}

inline void mpi_box_free(void* p)
{
    if (!p)
        return;
    MPI_Comm* pc = reinterpret_cast<MPI_Comm*>(p);
    if (*pc != MPI_COMM_NULL)
    {
        MPI_Comm tmp = *pc;
        MPI_Comm_free(&tmp);
    }
    delete pc;
}
