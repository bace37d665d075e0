#pragma once
#include "RuptureStore.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

/**
 * @file MemoryRuptureStore.hpp
 * @brief In-memory rupture store filled field by field (tests, benchmarks, small models).
 */

namespace disagg::store
{

class MemoryRuptureStore final : public hazard::IRuptureStore
{
  public:
    hazard::SiteCollection sitecol;
    std::vector<std::string> trt_names;
    hazard::MagsByTrt source_mags;
    bool atomic = false;

    std::vector<std::size_t> grp_trt;              // per group
    std::vector<hazard::RlzsByGsim> grp_rlzs;      // per group
    std::vector<double> rlz_weights;               // per realization

    hazard::RuptureColumns columns; // "mag", ..., "rrup_", ...
    std::vector<int> grp_ids;       // per rupture

    std::map<std::pair<int, int>, std::vector<double>> hcurves;                    // sid, rlz
    std::map<std::tuple<int, int, std::size_t>, std::vector<double>> pcurves;      // + gidx

    const hazard::SiteCollection& sites() const override { return sitecol; }
    const std::vector<std::string>& trts() const override { return trt_names; }
    hazard::MagsByTrt mags_by_trt() const override { return source_mags; }
    bool has_atomic_groups() const override { return atomic; }

    std::size_t num_groups() const override { return grp_trt.size(); }
    std::size_t group_trt(std::size_t gidx) const override { return grp_trt.at(gidx); }
    const hazard::RlzsByGsim& rlzs_by_gsim(std::size_t gidx) const override
    {
        return grp_rlzs.at(gidx);
    }

    std::size_t num_rlzs() const override { return rlz_weights.size(); }
    hazard::NdArray weights(const hazard::Imtls& imtls) const override;

    std::size_t num_ruptures() const override;
    std::vector<double> rupture_mags() const override;
    std::vector<int> rupture_grp_ids() const override { return grp_ids; }

    std::optional<std::vector<double>> curve(int sid, int rlz) const override;
    std::optional<std::vector<double>> group_curve(int sid, int rlz,
                                                   std::size_t gidx) const override;

    std::unique_ptr<hazard::IRuptureReader> open_reader() const override;
};

} // namespace disagg::store
