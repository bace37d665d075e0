#define CATCH_CONFIG_RUNNER
#include <catch2/catch_session.hpp>
#include <mpi.h>

#include "master/Log.hpp"

// Task farms run OpenMP workers and a reducer thread; only the main thread calls MPI.
struct MpiSession
{
    MpiSession(int& argc, char**& argv)
    {
        int inited = 0;
        MPI_Initialized(&inited);
        if (!inited)
        {
            int provided = 0;
            MPI_Init_thread(&argc, &argv, MPI_THREAD_FUNNELED, &provided);
        }
        disagg::master::logx::init({disagg::master::logx::Level::Warn, true});
    }
    ~MpiSession()
    {
        int finalized = 0;
        MPI_Finalized(&finalized);
        if (!finalized)
            MPI_Finalize();
    }
};

int main(int argc, char** argv)
{
    MpiSession mpi(argc, argv);
    return Catch::Session().run(argc, argv);
}
