#pragma once
#include "Aggregator.hpp"
#include "Imt.hpp"
#include "IntensityResolver.hpp"
#include "NdArray.hpp"
#include "RealizationSelector.hpp"
#include "Site.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @file PmfExtractor.hpp
 * @brief Named marginal PMFs of a 6-D disaggregation matrix and their provenance.
 *
 * @details
 * @rst
 * ==================  ==============  ===========================
 * name                shape           source
 * ==================  ==============  ===========================
 * ``Mag``             (Ma)            TRT-collapsed matrix
 * ``Dist``            (D)             TRT-collapsed matrix
 * ``TRT``             (T)             full matrix
 * ``Mag_Dist``        (Ma, D)         TRT-collapsed matrix
 * ``Mag_Dist_Eps``    (Ma, D, E)      TRT-collapsed matrix
 * ``Lon_Lat``         (Lo, La)        TRT-collapsed matrix
 * ``Mag_Lon_Lat``     (Ma, Lo, La)    TRT-collapsed matrix
 * ``Lon_Lat_TRT``     (Lo, La, T)     full matrix
 * ==================  ==============  ===========================
 *
 * Every reduction combines the dropped cells with ``1 - prod(1 - p)``.
 * @endrst
 */

namespace hazard
{

/// Either a realization id or the weighted mean of the selected realizations.
struct RlzRef
{
    enum class Kind
    {
        Indexed,
        Mean
    };
    Kind kind = Kind::Indexed;
    int id = 0;

    static RlzRef indexed(int r) { return {Kind::Indexed, r}; }
    static RlzRef mean() { return {Kind::Mean, -1}; }
    bool is_mean() const noexcept { return kind == Kind::Mean; }
    // "rlz-<id>-" or "" for the mean
    std::string prefix() const;
};

const std::vector<std::string>& pmf_names();

// `mat6` has shape (T, Ma, D, Lo, La, E)
NdArray extract_pmf(const std::string& name, const NdArray& mat6);

struct Pmf
{
    std::string name;
    NdArray values;
    double poe_agg = 0.0;
};

/// One output group: all PMFs of (site, rlz-or-mean, poe, imt).
struct PmfGroup
{
    std::string path; // disagg/<rlz-R->imt-sid-S-poe-K
    int site_id = 0;
    RlzRef rlz;
    std::optional<double> poe;
    std::size_t poe_index = 0;
    std::size_t imti = 0;
    std::string imt;
    std::optional<double> iml; // indexed realizations only
    std::pair<double, double> location;
    std::vector<Pmf> pmfs;

    std::vector<double> poe_agg() const;
};

std::string pmf_group_path(int sid, const RlzRef& rlz, const std::string& imt, std::size_t p);

// Selected PMFs that have a non-zero element; empty `names` means all
std::vector<Pmf> extract_pmfs(const NdArray& mat6, const std::vector<std::string>& names);

// (T, Ma, D, Lo, La, E) slice of an 8-D matrix at (p, z)
NdArray slice_pz(const NdArray& mat8, std::size_t p, std::size_t z);

struct PmfInputs
{
    const SiteCollection& sites;
    const RlzMatrix& rlzs;
    const NdArray& weights; // (R, M)
    const Imtls& imtls;
    std::vector<std::optional<double>> poes;
    const std::vector<int>& ok_sites;
    const ImlDic& imldic;
    std::vector<std::string> outputs;
};

/**
 * @brief PMF groups for every (imti, sid) matrix, every poe, every non-zero realization slice
 * and, when Z > 1, the weighted mean.
 *
 * Logs a warning when a PMF's aggregate PoE differs from the requested poe by more than 10%
 * at an ok site.
 */
std::vector<PmfGroup> build_pmf_groups(const std::map<Accumulator::Key, NdArray>& mat8s,
                                       const PmfInputs& in);

} // namespace hazard
