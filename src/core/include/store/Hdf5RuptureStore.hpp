#pragma once
#include "RuptureStore.hpp"
#include <hdf5.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * @file Hdf5RuptureStore.hpp
 * @brief Read-only rupture store backed by an HDF5 file.
 *
 * @details
 * @rst
 * Expected layout:
 *
 * .. code-block:: text
 *
 *    /sitecol/{sids,lons,lats,vs30}                 [N]
 *    /rup/{mag,rake,hypo_depth,occurrence_rate}     [U]
 *    /rup/grp_id                                    [U] int
 *    /rup/{rrup_,rjb_,lon_,lat_}                    [U, N]
 *    /full_lt/trts                                  [T] fixed-length strings
 *    /full_lt/grp_trt                               [G] int
 *    /full_lt/rlzs_by_grp/grp-<g>/<gsim>            [k] int
 *    /full_lt/weights                               [R] or [R, M]
 *    /source_mags/<trt>                             [*]
 *    /hcurves/rlz-<r>                               [N, L]   NaN row = no curve
 *    /pcurves/grp-<g>/rlz-<r>                       [N, L]   optional
 *    attribute "atomic" on /                        optional
 *
 * Every dataset of ``/rup`` except ``grp_id`` is handed to the tasks as a rupture column.
 * Metadata is loaded when the store is opened; curves and rupture rows are read on demand.
 * @endrst
 *
 * All HDF5 calls hold :cpp:func:`disagg::master::io::h5_mutex`; each reader owns a separate
 * read-only file handle.
 */

namespace disagg::store
{

class Hdf5RuptureStore final : public hazard::IRuptureStore
{
  public:
    static std::unique_ptr<Hdf5RuptureStore> open(const std::string& path);
    ~Hdf5RuptureStore() override;

    const hazard::SiteCollection& sites() const override { return sites_; }
    const std::vector<std::string>& trts() const override { return trts_; }
    hazard::MagsByTrt mags_by_trt() const override { return mags_by_trt_; }
    bool has_atomic_groups() const override { return atomic_; }

    std::size_t num_groups() const override { return grp_trt_.size(); }
    std::size_t group_trt(std::size_t gidx) const override { return grp_trt_.at(gidx); }
    const hazard::RlzsByGsim& rlzs_by_gsim(std::size_t gidx) const override
    {
        return rlzs_by_grp_.at(gidx);
    }

    std::size_t num_rlzs() const override { return num_rlzs_; }
    hazard::NdArray weights(const hazard::Imtls& imtls) const override;

    std::size_t num_ruptures() const override { return mags_.size(); }
    std::vector<double> rupture_mags() const override { return mags_; }
    std::vector<int> rupture_grp_ids() const override { return grp_ids_; }

    std::optional<std::vector<double>> curve(int sid, int rlz) const override;
    std::optional<std::vector<double>> group_curve(int sid, int rlz,
                                                   std::size_t gidx) const override;

    std::unique_ptr<hazard::IRuptureReader> open_reader() const override;

    const std::string& path() const noexcept { return path_; }

  private:
    explicit Hdf5RuptureStore(std::string path);

    std::string path_;
    hid_t file_ = -1;

    hazard::SiteCollection sites_;
    std::vector<std::string> trts_;
    hazard::MagsByTrt mags_by_trt_;
    bool atomic_ = false;
    std::vector<std::size_t> grp_trt_;
    std::vector<hazard::RlzsByGsim> rlzs_by_grp_;
    std::size_t num_rlzs_ = 0;
    std::vector<double> weights_; // R or R x Mw
    std::size_t weight_cols_ = 1;
    std::vector<double> mags_;
    std::vector<int> grp_ids_;

    std::optional<std::vector<double>> read_curve_row(const std::string& dset, int sid) const;
};

} // namespace disagg::store
