#include "BinEdges.hpp"
#include "Errors.hpp"
#include "master/Log.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <sstream>
#include <stdexcept>

namespace hazard
{

std::size_t ShapeDic::get(const std::string& key) const
{
    if (key == "mag")
        return mag;
    if (key == "dist")
        return dist;
    if (key == "lon")
        return lon;
    if (key == "lat")
        return lat;
    if (key == "eps")
        return eps;
    if (key == "trt")
        return trt;
    if (key == "N")
        return N;
    if (key == "M")
        return M;
    if (key == "P")
        return P;
    if (key == "Z")
        return Z;
    throw std::invalid_argument("ShapeDic: unknown key " + key);
}

void check_site_count(std::size_t N, std::size_t max_sites_disagg)
{
    if (N >= kMaxSites)
        throw ConfigError("You can disaggregate at max 32,768 sites");
    if (N > max_sites_disagg)
    {
        std::ostringstream msg;
        msg << "The number of sites to disaggregate is " << N
            << ", but you have max_sites_disagg=" << max_sites_disagg;
        throw ConfigError(msg.str());
    }
}

void check_matrix_size(const ShapeDic& s)
{
    const double n = s.matrix6_size();
    if (n > kMaxMatrixSize)
    {
        std::ostringstream msg;
        msg << "The disaggregation matrix is too large (" << static_cast<long long>(n)
            << " elements): fix the binning!";
        throw ConfigError(msg.str());
    }
}

std::vector<double> mag_edges(double min_mag, double max_mag, double w)
{
    const long n1 = static_cast<long>(std::floor(min_mag / w));
    long n2 = static_cast<long>(std::ceil(max_mag / w));
    const double top = std::round(w * double(n2) * 1000.0) / 1000.0;
    if (n2 == n1 || max_mag >= top)
        n2 += 1;
    std::vector<double> edges;
    edges.reserve(static_cast<std::size_t>(n2 - n1 + 1));
    for (long i = n1; i <= n2; ++i)
        edges.push_back(w * double(i));
    return edges;
}

std::vector<double> dist_edges(double maxdist, double w)
{
    const long n = static_cast<long>(std::ceil(maxdist / w));
    std::vector<double> edges;
    for (long i = 0; i <= n; ++i)
        edges.push_back(w * double(i));
    if (edges.size() < 2)
        edges.push_back(w);
    return edges;
}

std::vector<double> eps_edges(double tl, int E)
{
    std::vector<double> edges(static_cast<std::size_t>(E) + 1);
    for (int i = 0; i <= E; ++i)
        edges[static_cast<std::size_t>(i)] = -tl + 2.0 * tl * double(i) / double(E);
    edges.back() = tl;
    return edges;
}

static std::vector<double> centred_edges(double centre, double d, long n)
{
    std::vector<double> edges(static_cast<std::size_t>(2 * n + 1));
    for (long i = 0; i <= 2 * n; ++i)
        edges[static_cast<std::size_t>(i)] = centre - d + double(i) * d / double(n);
    return edges;
}

std::pair<std::vector<double>, std::vector<double>>
lon_lat_bins(double lon, double lat, double maxdist, double width)
{
    const long n = std::max(1L, static_cast<long>(std::ceil(maxdist * KM_TO_DEGREES / width)));
    const double dlat = std::min(maxdist * KM_TO_DEGREES, 90.0);
    const double coslat = std::cos(lat * std::numbers::pi / 180.0);
    const double dlon = coslat > 0.0 ? std::min(dlat / coslat, 180.0) : 180.0;
    return {centred_edges(lon, dlon, n), centred_edges(lat, dlat, n)};
}

std::pair<BinEdges, ShapeDic> build_bin_edges(const CalcParams& p, const SiteCollection& sites,
                                              const MagsByTrt& mags_by_trt, bool atomic)
{
    check_site_count(sites.size(), p.max_sites_disagg);
    if (atomic)
        throw ConfigError("Atomic groups are not supported");

    BinEdges b;
    double mmin = std::numeric_limits<double>::infinity();
    double mmax = -std::numeric_limits<double>::infinity();
    double maxdist = 0.0;
    for (const auto& [trt, mags] : mags_by_trt)
    {
        b.trts.push_back(trt);
        for (double m : mags)
        {
            mmin = std::min(mmin, m);
            mmax = std::max(mmax, m);
        }
        maxdist = std::max(maxdist, p.maximum_distance(trt));
    }
    if (b.trts.empty())
        throw DataError("The rupture store has no tectonic region types");

    if (p.mag_edges)
        b.mag = *p.mag_edges;
    else if (std::isfinite(mmin))
        b.mag = mag_edges(mmin, mmax, p.mag_bin_width);
    else
        throw DataError("No magnitudes found in source_mags");

    b.dist = p.dist_edges ? *p.dist_edges : dist_edges(maxdist, p.distance_bin_width);
    b.eps = p.eps_edges ? *p.eps_edges : eps_edges(p.truncation_level, p.num_epsilon_bins);

    for (const auto& site : sites)
    {
        auto [lons, lats] = lon_lat_bins(site.lon, site.lat, maxdist, p.coordinate_bin_width);
        b.lons.push_back(std::move(lons));
        b.lats.push_back(std::move(lats));
    }

    ShapeDic s;
    s.mag = b.mag.size() - 1;
    s.dist = b.dist.size() - 1;
    s.lon = b.lons.empty() ? 0 : b.lons.front().size() - 1;
    s.lat = b.lats.empty() ? 0 : b.lats.front().size() - 1;
    s.eps = b.eps.size() - 1;
    s.trt = b.trts.size();
    s.N = sites.size();
    check_matrix_size(s);

    LOGD("bin edges: mag=%zu dist=%zu lon=%zu lat=%zu eps=%zu trt=%zu\n", s.mag, s.dist, s.lon,
         s.lat, s.eps, s.trt);
    return {std::move(b), s};
}

std::optional<std::size_t> bin_index(std::span<const double> edges, double x) noexcept
{
    if (edges.size() < 2 || !(x >= edges.front()) || x > edges.back())
        return std::nullopt;
    const std::size_t nbins = edges.size() - 1;
    if (x == edges.back())
        return nbins - 1;
    auto it = std::upper_bound(edges.begin(), edges.end(), x);
    return static_cast<std::size_t>(it - edges.begin()) - 1;
}

std::optional<std::size_t> lon_bin_index(std::span<const double> edges, double x) noexcept
{
    if (edges.size() < 2)
        return std::nullopt;
    if (x < edges.front())
        x += 360.0;
    else if (x > edges.back())
        x -= 360.0;
    return bin_index(edges, x);
}

} // namespace hazard
