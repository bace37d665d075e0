#include "master/Outputs.hpp"
#include <cstdint>
#include <string>

namespace disagg::master
{

namespace
{

io::WriteRequest dataset(std::string path, const std::vector<double>& v)
{
    io::WriteRequest req;
    req.path = std::move(path);
    req.shape = {v.size()};
    req.data = v;
    return req;
}

} // namespace

void save_bin_edges(io::IWriter& w, const hazard::BinEdges& edges)
{
    w.write(dataset("disagg-bins/mags", edges.mag));
    w.write(dataset("disagg-bins/dists", edges.dist));
    for (std::size_t s = 0; s < edges.lons.size(); ++s)
    {
        const std::string sid = "sid-" + std::to_string(s);
        w.write(dataset("disagg-bins/lons/" + sid, edges.lons[s]));
        w.write(dataset("disagg-bins/lats/" + sid, edges.lats[s]));
    }
    w.write(dataset("disagg-bins/eps", edges.eps));
}

void save_best_rlzs(io::IWriter& w, const hazard::RlzMatrix& rlzs)
{
    io::WriteRequest req;
    req.path = "best_rlzs";
    req.shape = {rlzs.N(), rlzs.Z()};
    req.data = std::vector<std::int64_t>(rlzs.ids().begin(), rlzs.ids().end());
    w.write(req);
}

void save_by_source(io::IWriter& w, const std::vector<hazard::BySourceRecord>& recs)
{
    for (const auto& r : recs)
    {
        io::WriteRequest req = dataset(r.path, r.poes);
        req.attrs.emplace_back("poe_agg", r.poe_agg);
        req.attrs.emplace_back("rlzi", std::int64_t(r.rlz));
        w.write(req);
    }
}

void save_pmf_groups(io::IWriter& w, const std::vector<hazard::PmfGroup>& groups,
                     const hazard::BinEdges& edges)
{
    for (const auto& g : groups)
    {
        for (const auto& pmf : g.pmfs)
        {
            io::WriteRequest req;
            req.path = g.path + "/" + pmf.name;
            req.shape = pmf.values.shape();
            req.data = std::vector<double>(pmf.values.data(),
                                           pmf.values.data() + pmf.values.size());
            req.attrs.emplace_back("poe_agg", pmf.poe_agg);
            w.write(req);
        }

        const auto s = static_cast<std::size_t>(g.site_id);
        io::WriteRequest attrs;
        attrs.path = g.path;
        attrs.attrs.emplace_back("site_id", std::int64_t(g.site_id));
        if (g.rlz.is_mean())
            attrs.attrs.emplace_back("rlzi", std::string("mean"));
        else
            attrs.attrs.emplace_back("rlzi", std::int64_t(g.rlz.id));
        attrs.attrs.emplace_back("imt", g.imt);
        if (g.iml)
            attrs.attrs.emplace_back("iml", *g.iml);
        attrs.attrs.emplace_back("mag_bin_edges", edges.mag);
        attrs.attrs.emplace_back("dist_bin_edges", edges.dist);
        attrs.attrs.emplace_back("lon_bin_edges", edges.lons.at(s));
        attrs.attrs.emplace_back("lat_bin_edges", edges.lats.at(s));
        attrs.attrs.emplace_back("eps_bin_edges", edges.eps);
        attrs.attrs.emplace_back("trt_bin_edges", edges.trts);
        attrs.attrs.emplace_back("location",
                                 std::vector<double>{g.location.first, g.location.second});
        attrs.attrs.emplace_back("poe_agg", g.poe_agg());
        if (g.poe)
            attrs.attrs.emplace_back("poe", *g.poe);
        w.write(attrs);
    }

    io::WriteRequest top;
    top.path = "disagg";
    top.attrs.emplace_back("trts", edges.trts);
    w.write(top);
}

} // namespace disagg::master
