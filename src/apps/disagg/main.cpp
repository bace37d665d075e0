#include "master/Calculator.hpp"
#include "master/Log.hpp"
#include "master/MpiBox.hpp"
#include "master/PluginHost.hpp"
#include "master/RunContext.hpp"
#include "master/io/AsyncWriter.hpp"
#include "master/io/ConfigYAML.hpp" // AppConfig + load_config_from_yaml()
#include "master/io/Hdf5Writer.hpp"
#include "master/io/NullWriter.hpp"
#include "master/io/WriterConfig.hpp"
#include "store/Hdf5RuptureStore.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <thread>

#include <mpi.h>
#include <omp.h>

#ifdef __linux__
#include <sched.h>
#endif

using disagg::master::Calculator;
using disagg::master::PluginHost;
using disagg::master::RunContext;
using disagg::master::io::AsyncWriter;
using disagg::master::io::Hdf5Writer;
using disagg::master::io::IWriter;
using disagg::master::io::NullWriter;
using disagg::master::io::WriterConfig;
using disagg::store::Hdf5RuptureStore;

// Initializes MPI (FUNNELED: only the main thread calls MPI) exactly once; finalizes only if
// we were the owner.
struct MpiOnce
{
    bool mpi_owner{false};

    MpiOnce(int& argc, char**& argv)
    {
        int inited = 0;
        MPI_Initialized(&inited);
        if (!inited)
        {
            int provided = MPI_THREAD_SINGLE;
            MPI_Init_thread(&argc, &argv, MPI_THREAD_FUNNELED, &provided);
            mpi_owner = true;
        }
    }
    ~MpiOnce()
    {
        int mfin = 0;
        MPI_Finalized(&mfin);
        if (!mfin && mpi_owner)
            MPI_Finalize();
    }
};

static int count_available_logical_cpus()
{
#ifdef __linux__
    cpu_set_t mask;
    CPU_ZERO(&mask);
    if (sched_getaffinity(0, sizeof(mask), &mask) == 0)
        return CPU_COUNT(&mask);
#endif
    unsigned n = std::thread::hardware_concurrency();
    return n ? static_cast<int>(n) : 1;
}

static void setenv_if_empty(const char* k, const char* v)
{
    if (!std::getenv(k))
        setenv(k, v, 1);
}

static void setup_openmp_defaults(int requested)
{
    const int n_thr = requested > 0 ? requested : std::max(1, count_available_logical_cpus());
    {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%d", n_thr);
        setenv_if_empty("OMP_NUM_THREADS", buf);
    }
    setenv_if_empty("OMP_PROC_BIND", "close");
    setenv_if_empty("OMP_DYNAMIC", "FALSE");

    omp_set_dynamic(0);
    if (requested > 0 || !std::getenv("OMP_NUM_THREADS"))
        omp_set_num_threads(n_thr);
}

static void print_omp_summary()
{
    const char* nt = std::getenv("OMP_NUM_THREADS");
    const char* pb = std::getenv("OMP_PROC_BIND");
    LOGI("OpenMP: threads=%s bind=%s (max_threads=%d)\n", (nt ? nt : "?"), (pb ? pb : "?"),
         omp_get_max_threads());
}

static std::unique_ptr<IWriter> make_writer(const WriterConfig& wcfg)
{
    std::unique_ptr<IWriter> sink;
    switch (wcfg.backend)
    {
    case WriterConfig::Backend::Hdf5:
        sink = std::make_unique<Hdf5Writer>(wcfg);
        break;
    default:
        sink = std::make_unique<NullWriter>();
        break;
    }
    if (wcfg.async.enabled)
    {
        AsyncWriter::Options opt{};
        opt.max_queue = wcfg.async.max_queue;
        sink = std::make_unique<AsyncWriter>(std::move(sink), opt);
    }
    return sink;
}

static int run(int argc, char** argv)
{
    // 1) Parse YAML config
    const std::string cfg_path = (argc > 1) ? argv[1] : "case.yaml";
    const AppConfig cfg = load_config_from_yaml(cfg_path);
    if (cfg.store_path.empty())
        throw hazard::ConfigError("input.store is required");

    setup_openmp_defaults(cfg.threads);

    // 2) RunContext
    RunContext rc{};
    rc.mpi_comm = mpi_box(MPI_COMM_WORLD);
    MPI_Comm comm = mpi_unbox(rc.mpi_comm);
    MPI_Comm_rank(comm, &rc.world_rank);
    MPI_Comm_size(comm, &rc.world_size);
    rc.num_threads = omp_get_max_threads();
    if (rc.world_rank == 0)
        print_omp_summary();
    LOGI("[run] mpi=%d | omp=%d | case=%s | store=%s\n", rc.world_size, rc.num_threads,
         cfg.case_name.c_str(), cfg.store_path.c_str());

    {
        // 3) Plugins first: the models they create must not outlive the libraries
        PluginHost host;
        for (const auto& lib : cfg.plugin_libs)
            host.load_library(lib);
        auto gmms = host.make_gmms(cfg.gmms, rc);

        // 4) Store, writer, calculator
        auto store = Hdf5RuptureStore::open(cfg.store_path);
        auto writer = make_writer(cfg.io);

        Calculator calc(rc, cfg.calc, *store, std::move(gmms), *writer, cfg.case_name);
        const auto groups = calc.run();
        if (rc.world_rank == 0 && groups.empty())
            LOGW("No disaggregation output was produced\n");
    }

    mpi_box_free(rc.mpi_comm);
    return 0;
}

int main(int argc, char** argv)
{
    MpiOnce runtime(argc, argv);

    // rank0-gated INFO/DEBUG; DISAGG_LOG=quiet|error|warn|info|debug overrides the level
    disagg::master::logx::init({disagg::master::logx::Level::Info, /*rank0_only*/ true});

    try
    {
        return run(argc, argv);
    }
    catch (const hazard::ConfigError& e)
    {
        LOGE("configuration error: %s\n", e.what());
        return 2;
    }
    catch (const std::exception& e)
    {
        LOGE("%s\n", e.what());
        return 1;
    }
}
