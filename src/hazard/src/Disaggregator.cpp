#include "Disaggregator.hpp"
#include "Errors.hpp"
#include "master/Log.hpp"
#include <algorithm>
#include <cmath>

namespace hazard
{

DisaggData disaggregate(const std::vector<RuptureContext>& ctxs, const ZsByGsim& zs_by_gsim,
                        const Imt& imt, const NdArray& iml2, const EpsilonBins& eps)
{
    const std::size_t U = ctxs.size(), E = eps.size();
    const std::size_t P = iml2.shape()[0], Z = iml2.shape()[1];

    DisaggData out;
    out.dists.reserve(U);
    out.lons.reserve(U);
    out.lats.reserve(U);
    for (const auto& ctx : ctxs)
    {
        out.dists.push_back(ctx.rrup);
        out.lons.push_back(ctx.lon);
        out.lats.push_back(ctx.lat);
    }
    out.pnes = NdArray({U, E, P, Z}, 1.0);

    std::vector<double> contrib(E);
    for (const auto& [gmm, zs] : zs_by_gsim)
    {
        for (std::size_t u = 0; u < U; ++u)
        {
            const auto& ctx = ctxs[u];
            const MeanStd ms = gmm->mean_std(ctx, imt);
            for (std::size_t z : zs)
                for (std::size_t p = 0; p < P; ++p)
                {
                    const double iml = iml2.at({p, z});
                    if (!std::isfinite(iml) || iml <= 0.0)
                        continue;
                    const double lvl = (std::log(iml) - ms.mean) / ms.sigma;
                    eps.contributions(lvl, contrib);
                    for (std::size_t e = 0; e < E; ++e)
                        out.pnes.at({u, e, p, z}) = ctx.tom.pne(ctx.occurrence_rate, contrib[e]);
                }
        }
    }
    return out;
}

NdArray build_disagg_matrix(const DisaggData& data, std::span<const double> dist_edges,
                            std::span<const double> lon_edges, std::span<const double> lat_edges)
{
    const auto& ps = data.pnes.shape(); // (U, E, P, Z)
    const std::size_t U = ps[0];
    const std::size_t inner = ps[1] * ps[2] * ps[3];
    NdArray mat({dist_edges.size() - 1, lon_edges.size() - 1, lat_edges.size() - 1, ps[1], ps[2],
                 ps[3]},
                1.0);
    for (std::size_t u = 0; u < U; ++u)
    {
        const auto d = bin_index(dist_edges, data.dists[u]);
        const auto lo = lon_bin_index(lon_edges, data.lons[u]);
        const auto la = bin_index(lat_edges, data.lats[u]);
        if (!d || !lo || !la)
            continue;
        double* cell = mat.data() + mat.offset({*d, *lo, *la, 0, 0, 0});
        const double* pne = data.pnes.data() + u * inner;
        for (std::size_t i = 0; i < inner; ++i)
            cell[i] *= pne[i];
    }
    for (std::size_t i = 0; i < mat.size(); ++i)
        mat[i] = 1.0 - mat[i];
    return mat;
}

static ZsByGsim zs_by_gsim_for(int sid, const TaskInputs& in, std::size_t gidx)
{
    ZsByGsim out;
    const auto row = in.rlzs.row(static_cast<std::size_t>(sid));
    for (const auto& [gsim, rlzs] : in.rlzs_by_gsim.at(gidx))
    {
        std::vector<std::size_t> zs;
        for (std::size_t z = 0; z < row.size(); ++z)
            if (std::find(rlzs.begin(), rlzs.end(), row[z]) != rlzs.end())
                zs.push_back(z);
        if (zs.empty())
            continue;
        auto it = in.gmms.find(gsim);
        if (it == in.gmms.end())
            throw ConfigError("No ground-motion model configured for gsim " + gsim);
        out.emplace_back(it->second.get(), std::move(zs));
    }
    return out;
}

PartialResult compute_disagg(const TaskSpec& task, const TaskInputs& in, IRuptureReader& reader)
{
    PartialResult res;
    res.trti = task.trti;
    res.magi = task.magi;
    res.imti = task.imti;

    const RuptureColumns cols = reader.read(task.idxs);
    const auto rrup = cols.find("rrup_");
    if (rrup == cols.end())
        throw ConfigError("Missing rupture column: rrup_");

    const PoissonTOM tom{in.params.investigation_time};
    const EpsilonBins eps(in.params.truncation_level, in.edges.eps);
    const double maxdist = in.params.maximum_distance(in.edges.trts.at(task.trti));
    const Iml3& iml3 = in.iml3.at(task.imti);
    const std::size_t P = iml3.iml.shape()[1], Z = iml3.iml.shape()[2];
    const std::size_t U = task.idxs.size();

    for (int sid : in.ok_sites)
    {
        const auto s = static_cast<std::size_t>(sid);
        std::vector<RuptureContext> ctxs;
        for (std::size_t u = 0; u < U; ++u)
        {
            if (!(rrup->second.at(u, s) <= maxdist))
                continue;
            std::map<std::string, double> row;
            for (const auto& [name, col] : cols)
            {
                if (!name.empty() && name.back() == '_')
                    row[name.substr(0, name.size() - 1)] = col.at(u, s);
                else
                    row[name] = col.at(u);
            }
            row["vs30"] = in.sites[s].vs30;
            ctxs.push_back(RuptureContext::from_columns(row, tom));
        }
        if (ctxs.empty())
            continue;

        const ZsByGsim zs = zs_by_gsim_for(sid, in, task.gidx);
        if (zs.empty())
            continue;

        NdArray iml2({P, Z});
        for (std::size_t p = 0; p < P; ++p)
            for (std::size_t z = 0; z < Z; ++z)
                iml2.at({p, z}) = iml3.iml.at({s, p, z});

        const DisaggData data = disaggregate(ctxs, zs, iml3.imt, iml2, eps);
        NdArray mat = build_disagg_matrix(data, in.edges.dist, in.edges.lons.at(s),
                                          in.edges.lats.at(s));
        if (mat.any())
            res.by_site.emplace(sid, std::move(mat));
    }
    LOGD("task grp=%zu mag=%zu imt=%zu: %zu ruptures, %zu sites\n", task.gidx, task.magi,
         task.imti, U, res.by_site.size());
    return res;
}

} // namespace hazard
