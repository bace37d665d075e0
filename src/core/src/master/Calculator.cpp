#include "master/Calculator.hpp"
#include "DisaggBySource.hpp"
#include "Errors.hpp"
#include "master/Log.hpp"
#include "master/MpiBox.hpp"
#include "master/Outputs.hpp"
#include "master/Reduce.hpp"
#include "master/TaskFarm.hpp"
#include "master/io/Preflight.hpp"

#include <algorithm>
#include <tuple>

#include <mpi.h>
#include <omp.h>

namespace disagg::master
{

Calculator::Calculator(const RunContext& rc, const hazard::CalcParams& params,
                       const hazard::IRuptureStore& store, hazard::GmmsByName gmms,
                       io::IWriter& writer, std::string case_name)
    : rc_(rc), params_(params), store_(store), gmms_(std::move(gmms)), writer_(writer),
      case_name_(std::move(case_name))
{
    int inited = 0;
    MPI_Initialized(&inited);
    if (inited)
        MPI_Comm_rank(mpi_unbox(rc_.mpi_comm), &rank_);
}

std::size_t Calculator::concurrent_tasks_() const
{
    if (params_.concurrent_tasks > 0)
        return static_cast<std::size_t>(params_.concurrent_tasks);
    const int threads = rc_.num_threads > 0 ? rc_.num_threads : omp_get_max_threads();
    return static_cast<std::size_t>(2 * std::max(1, rc_.world_size) * std::max(1, threads));
}

void Calculator::init()
{
    params_.validate();
    hazard::check_site_count(store_.sites().size(), params_.max_sites_disagg);
}

hazard::Accumulator Calculator::execute()
{
    const auto& sites = store_.sites();
    const std::size_t N = sites.size();
    const std::size_t M = params_.imtls.size();
    const std::size_t R = store_.num_rlzs();

    std::tie(edges_, shape_) = hazard::build_bin_edges(params_, sites, store_.mags_by_trt(),
                                                       store_.has_atomic_groups());
    const auto poes = params_.poes();
    shape_.M = M;
    shape_.P = poes.size();

    weights_ = store_.weights(params_.imtls);
    const hazard::CurveGetter get_curve = [this](int sid, int rlz)
    { return store_.curve(sid, rlz); };
    selection_ = hazard::select_realizations(params_, N, R, weights_, get_curve);
    shape_.Z = selection_.rlzs.Z();

    resolved_ = hazard::resolve_intensities(params_, selection_.rlzs, get_curve);
    if (params_.disagg_by_src && rank_ == 0)
        by_src_ = hazard::disagg_by_source(
            params_, selection_.rlzs, resolved_.iml3, store_.num_groups(),
            [this](int sid, int rlz, std::size_t gidx)
            { return store_.group_curve(sid, rlz, gidx); });

    double tot = 0.0;
    for (const auto& kv : io::outputs_size(shape_, params_.disagg_outputs))
        tot += kv.second;
    LOGI("Total output size: %s\n", io::humansize(tot).c_str());

    const std::size_t U = store_.num_ruptures();
    const std::size_t blocksize = task_blocksize(U, concurrent_tasks_(), M);
    LOGI("Found %zu ruptures, sending up to %zu per task\n", U, blocksize);
    const auto tasks = build_tasks(store_, edges_.mag, M, blocksize);
    num_tasks_ = tasks.size();

    const auto [ok, msg] = io::run_preflight(shape_, num_tasks_, params_.max_data_transfer);
    if (!ok)
        throw hazard::ConfigError("Estimated data transfer too big\n" + msg);
    LOGI("Estimated data transfer: %s\n", msg.c_str());

    rlzs_by_gsim_.clear();
    for (std::size_t g = 0; g < store_.num_groups(); ++g)
        rlzs_by_gsim_.push_back(store_.rlzs_by_gsim(g));

    const hazard::TaskInputs in{params_,          edges_, sites,          selection_.rlzs,
                                resolved_.iml3,   resolved_.ok_sites,     rlzs_by_gsim_,
                                gmms_};
    ReduceShape rshape;
    rshape.M = M;
    rshape.N = N;
    rshape.T = shape_.trt;
    rshape.Ma = shape_.mag;
    rshape.shape6 = {shape_.dist, shape_.lon, shape_.lat, shape_.eps, shape_.P, shape_.Z};

    TaskFarm farm(rc_, store_);
    return farm.run(tasks, in, rshape);
}

std::vector<hazard::PmfGroup> Calculator::post_execute(const hazard::Accumulator& results)
{
    if (rank_ != 0)
        return {};

    const auto mat8s = hazard::assemble(results, shape_.trt, shape_.mag);
    LOGI("Extracting and saving the PMFs for %zu outputs (N=%zu, P=%zu, M=%zu, Z=%zu)\n",
         shape_.N * shape_.P * shape_.M * shape_.Z, shape_.N, shape_.P, shape_.M, shape_.Z);

    const hazard::PmfInputs in{store_.sites(),      selection_.rlzs,  weights_,
                               params_.imtls,       params_.poes(),   resolved_.ok_sites,
                               resolved_.imldic,    params_.disagg_outputs};
    auto groups = hazard::build_pmf_groups(mat8s, in);

    writer_.open_case(case_name_);
    if (selection_.by_closeness)
        save_best_rlzs(writer_, selection_.rlzs);
    save_by_source(writer_, by_src_);
    save_bin_edges(writer_, edges_);
    save_pmf_groups(writer_, groups, edges_);
    writer_.close();
    LOGI("Saved %zu disaggregation groups\n", groups.size());
    return groups;
}

std::vector<hazard::PmfGroup> Calculator::run()
{
    init();
    const hazard::Accumulator acc = execute();
    return post_execute(acc);
}

} // namespace disagg::master
