#include "master/Reduce.hpp"
#include "simple_bench.hpp"

using namespace disagg::master;

int main(int argc, char** argv)
{
    int provided = 0;
    MPI_Init_thread(&argc, &argv, MPI_THREAD_FUNNELED, &provided);
    int rank = 0;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    {
        ReduceShape shape;
        shape.M = 2;
        shape.N = 10;
        shape.T = 2;
        shape.Ma = 8;
        shape.shape6 = {10, 6, 6, 4, 2, 3};

        auto fill = [&]
        {
            hazard::Accumulator acc;
            for (std::size_t m = 0; m < shape.M; ++m)
                for (int sid = 0; sid < int(shape.N); ++sid)
                    for (std::size_t magi = std::size_t(rank) % 2; magi < shape.Ma; magi += 2)
                        acc.add({m, sid}, {0, magi}, hazard::NdArray(shape.shape6, 1e-3));
            return acc;
        };

        const double nmat = double(shape.M * shape.N * shape.Ma);
        auto [mean, stddev] = bench::run_mpi_max(
            MPI_COMM_WORLD, [&] { (void) reduce_to_root(fill(), shape, MPI_COMM_WORLD); }, 5);
        bench::report_root(MPI_COMM_WORLD, "reduce_to_root_320_matrices", mean, stddev, nmat);
    }
    MPI_Finalize();
    return 0;
}
