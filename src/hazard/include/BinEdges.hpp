#pragma once
#include "Params.hpp"
#include "Site.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

/**
 * @file BinEdges.hpp
 * @brief Discretisation of the disaggregation space and the shape dictionary.
 *
 * @details
 * Magnitude, distance and epsilon edges are global; longitude and latitude edges are centred
 * on each site and always have the same number of bins, so the 6-D matrix
 * ``(T, Ma, D, Lo, La, E)`` has one shape for the whole run.
 *
 * @rst
 * Binning convention
 * ------------------
 * A raw value ``x`` falls in bin ``k`` when ``edges[k] <= x < edges[k+1]``. A value equal to
 * the last edge goes to the last bin. Values outside ``[edges.front(), edges.back()]`` have no
 * bin (:cpp:func:`hazard::bin_index` returns ``std::nullopt``) and the caller skips them.
 *
 * .. code-block:: cpp
 *
 *   auto [edges, shape] = hazard::build_bin_edges(params, sites, mags_by_trt, false);
 *   hazard::check_matrix_size(shape);          // throws ConfigError above 1e6 elements
 *   auto d = hazard::bin_index(edges.dist, 37.5);
 * @endrst
 */

namespace hazard
{

inline constexpr double KM_TO_DEGREES = 0.0089932; // 1 degree ~ 111 km
inline constexpr std::size_t kMaxSites = 32768;
inline constexpr double kMaxMatrixSize = 1e6;

struct BinEdges
{
    std::vector<double> mag;
    std::vector<double> dist;
    std::vector<std::vector<double>> lons; // per site
    std::vector<std::vector<double>> lats; // per site
    std::vector<double> eps;
    std::vector<std::string> trts;
};

/// Sizes keyed the way output names are spelled (lower-cased, split on '_').
struct ShapeDic
{
    std::size_t mag = 0, dist = 0, lon = 0, lat = 0, eps = 0, trt = 0;
    std::size_t N = 0, M = 0, P = 0, Z = 0;

    double matrix6_size() const noexcept
    {
        return double(trt) * double(mag) * double(dist) * double(lon) * double(lat) * double(eps);
    }
    // "mag", "dist", "lon", "lat", "eps", "trt", "N", "M", "P", "Z"; throws on unknown keys
    std::size_t get(const std::string& key) const;
};

/// Observed magnitudes per tectonic region type, in model TRT order.
using MagsByTrt = std::vector<std::pair<std::string, std::vector<double>>>;

// N >= 32768 or N > max_sites_disagg -> ConfigError
void check_site_count(std::size_t N, std::size_t max_sites_disagg);

void check_matrix_size(const ShapeDic& shape);

std::vector<double> mag_edges(double min_mag, double max_mag, double width);
std::vector<double> dist_edges(double maxdist, double width);
std::vector<double> eps_edges(double truncation_level, int num_epsilon_bins);

// Lon/lat edges centred on (lon, lat); both have 2n bins.
std::pair<std::vector<double>, std::vector<double>>
lon_lat_bins(double lon, double lat, double maxdist, double coord_bin_width);

/**
 * @brief Build all edges and the shape dictionary.
 *
 * @throws ConfigError on atomic groups, site limits, or a 6-D matrix above one million
 * elements. `P`, `M` and `Z` are left to the caller.
 */
std::pair<BinEdges, ShapeDic> build_bin_edges(const CalcParams& params,
                                              const SiteCollection& sites,
                                              const MagsByTrt& mags_by_trt, bool atomic);

std::optional<std::size_t> bin_index(std::span<const double> edges, double x) noexcept;

// Shifts x by +-360 towards the edge range before binning (date line)
std::optional<std::size_t> lon_bin_index(std::span<const double> edges, double x) noexcept;

} // namespace hazard
