#include "master/TaskFarm.hpp"
#include "BinEdges.hpp"
#include "Errors.hpp"
#include "master/Log.hpp"
#include "master/MpiBox.hpp"
#include "master/Progress.hpp"
#include "master/ResultQueue.hpp"
#include "master/RunContext.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

#include <mpi.h>
#include <omp.h>

namespace disagg::master
{

namespace
{

bool mpi_active()
{
    int inited = 0, finalized = 0;
    MPI_Initialized(&inited);
    MPI_Finalized(&finalized);
    return inited && !finalized;
}

} // namespace

std::size_t task_blocksize(std::size_t U, std::size_t concurrent_tasks, std::size_t M)
{
    const double ct = concurrent_tasks ? double(concurrent_tasks) : 1.0;
    const double b = std::ceil(double(U) / ct * double(M));
    return b < 1.0 ? 1 : static_cast<std::size_t>(b);
}

std::vector<hazard::TaskSpec> build_tasks(const hazard::IRuptureStore& store,
                                          std::span<const double> mag_edges,
                                          std::size_t num_imts, std::size_t blocksize)
{
    if (blocksize == 0)
        throw std::invalid_argument("build_tasks: blocksize must be positive");
    const std::vector<double> mags = store.rupture_mags();
    const std::vector<int> grp_ids = store.rupture_grp_ids();
    if (mags.size() != grp_ids.size())
        throw hazard::DataError("rup/mag and rup/grp_id have different lengths");

    std::map<std::pair<std::size_t, std::size_t>, std::vector<std::size_t>> indices;
    std::size_t outside = 0;
    for (std::size_t u = 0; u < mags.size(); ++u)
    {
        const auto magi = hazard::bin_index(mag_edges, mags[u]);
        if (!magi || grp_ids[u] < 0)
        {
            ++outside;
            continue;
        }
        indices[{std::size_t(grp_ids[u]), *magi}].push_back(u);
    }
    if (outside)
        LOGW("%zu ruptures are outside the magnitude bins and are ignored\n", outside);

    std::vector<hazard::TaskSpec> tasks;
    for (const auto& [gm, idxs] : indices)
    {
        const std::size_t trti = store.group_trt(gm.first);
        for (std::size_t start = 0; start < idxs.size(); start += blocksize)
        {
            const std::size_t stop = std::min(idxs.size(), start + blocksize);
            for (std::size_t m = 0; m < num_imts; ++m)
            {
                hazard::TaskSpec t;
                t.gidx = gm.first;
                t.trti = trti;
                t.magi = gm.second;
                t.imti = m;
                t.idxs.assign(idxs.begin() + long(start), idxs.begin() + long(stop));
                tasks.push_back(std::move(t));
            }
        }
    }
    return tasks;
}

TaskFarm::TaskFarm(const RunContext& rc, const hazard::IRuptureStore& store)
    : TaskFarm(rc, store, Options{})
{
}

TaskFarm::TaskFarm(const RunContext& rc, const hazard::IRuptureStore& store, Options o)
    : rc_(rc), store_(store), opt_(o)
{
}

hazard::Accumulator TaskFarm::run_local(const std::vector<hazard::TaskSpec>& tasks,
                                        const hazard::TaskInputs& in)
{
    const bool use_mpi = mpi_active();
    int rank = 0, size = 1;
    if (use_mpi)
    {
        MPI_Comm comm = mpi_unbox(rc_.mpi_comm);
        MPI_Comm_rank(comm, &rank);
        MPI_Comm_size(comm, &size);
    }

    std::vector<const hazard::TaskSpec*> mine;
    for (std::size_t i = static_cast<std::size_t>(rank); i < tasks.size();
         i += static_cast<std::size_t>(size))
        mine.push_back(&tasks[i]);
    LOGD("[farm] %zu of %zu tasks on this rank\n", mine.size(), tasks.size());

    hazard::Accumulator acc;
    ResultQueue<hazard::PartialResult> queue(opt_.max_queue);
    std::exception_ptr reduce_error;

    prog::Bar pbar;
    pbar.start(static_cast<long>(mine.size()), rank == 0, "disagg");

    std::thread reducer(
        [&]
        {
            while (auto r = queue.pop())
            {
                if (!reduce_error)
                {
                    try
                    {
                        acc.add(std::move(*r));
                    }
                    catch (...)
                    {
                        reduce_error = std::current_exception();
                    }
                }
                pbar.tick();
            }
        });

    std::atomic<bool> failed{false};
    std::exception_ptr task_error;
    std::mutex err_mtx;

    const long n = static_cast<long>(mine.size());
#pragma omp parallel for schedule(dynamic)
    for (long i = 0; i < n; ++i)
    {
        if (failed.load(std::memory_order_relaxed))
            continue;
        try
        {
            auto reader = store_.open_reader();
            queue.push(hazard::compute_disagg(*mine[std::size_t(i)], in, *reader));
        }
        catch (...)
        {
            std::lock_guard<std::mutex> lk(err_mtx);
            if (!task_error)
                task_error = std::current_exception();
            failed.store(true);
        }
    }

    queue.close();
    reducer.join();
    pbar.finish();

    if (!task_error && reduce_error)
        task_error = reduce_error;

    int local_err = task_error ? 1 : 0, any_err = local_err;
    if (use_mpi)
        MPI_Allreduce(&local_err, &any_err, 1, MPI_INT, MPI_MAX, mpi_unbox(rc_.mpi_comm));
    if (task_error)
        std::rethrow_exception(task_error);
    if (any_err)
        throw std::runtime_error("A disaggregation task failed on another rank");
    return acc;
}

hazard::Accumulator TaskFarm::run(const std::vector<hazard::TaskSpec>& tasks,
                                  const hazard::TaskInputs& in, const ReduceShape& shape)
{
    hazard::Accumulator acc = run_local(tasks, in);
    if (!mpi_active())
        return acc;
    return reduce_to_root(std::move(acc), shape, mpi_unbox(rc_.mpi_comm));
}

} // namespace disagg::master
