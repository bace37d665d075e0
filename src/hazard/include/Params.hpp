#pragma once
#include "Imt.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @file Params.hpp
 * @brief Calculation parameters of a disaggregation run.
 *
 * @details
 * @rst
 * Filled by the YAML loader (``calculation:`` section) and passed by const reference to every
 * stage. Exactly one of ``poes_disagg`` / ``iml_disagg`` must be given:
 *
 * - ``poes_disagg``: the IML of each poe is obtained by inverting the hazard curves;
 * - ``iml_disagg``: one fixed IML per IMT, no hazard curves are read and ``P == 1``.
 *
 * :cpp:func:`hazard::CalcParams::validate` raises :cpp:struct:`hazard::ConfigError` on
 * inconsistent settings.
 * @endrst
 */

namespace hazard
{

struct MaximumDistance
{
    double default_km = 200.0;
    std::map<std::string, double> by_trt;

    double operator()(const std::string& trt) const
    {
        auto it = by_trt.find(trt);
        return it == by_trt.end() ? default_km : it->second;
    }
};

struct CalcParams
{
    double investigation_time = 50.0;
    double truncation_level = 3.0;
    MaximumDistance maximum_distance;

    double mag_bin_width = 0.5;
    double distance_bin_width = 10.0;
    double coordinate_bin_width = 1.0;
    int num_epsilon_bins = 1;

    // disagg_bin_edges (explicit edges override the widths)
    std::optional<std::vector<double>> mag_edges;
    std::optional<std::vector<double>> dist_edges;
    std::optional<std::vector<double>> eps_edges;

    Imtls imtls;
    std::vector<double> poes_disagg;
    std::vector<std::pair<std::string, double>> iml_disagg; // imt -> iml

    std::optional<std::vector<int>> rlz_index;
    int num_rlzs_disagg = 1;
    std::size_t max_sites_disagg = 10;

    std::vector<std::string> disagg_outputs; // empty = all PMFs
    bool disagg_by_src = false;

    int concurrent_tasks = 0;         // 0 = derived from ranks x threads
    double max_data_transfer = 2e11;  // bytes

    // {nullopt} when intensities are fixed
    std::vector<std::optional<double>> poes() const;

    std::optional<double> fixed_iml(const std::string& imt) const;

    void validate() const;
};

} // namespace hazard
