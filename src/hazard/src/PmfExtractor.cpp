#include "PmfExtractor.hpp"
#include "Errors.hpp"
#include "Probability.hpp"
#include "master/Log.hpp"
#include <algorithm>
#include <cmath>

namespace hazard
{

std::string RlzRef::prefix() const
{
    return is_mean() ? std::string() : "rlz-" + std::to_string(id) + "-";
}

const std::vector<std::string>& pmf_names()
{
    static const std::vector<std::string> names{"Mag",     "Dist",        "TRT",
                                                "Mag_Dist", "Mag_Dist_Eps", "Lon_Lat",
                                                "Mag_Lon_Lat", "Lon_Lat_TRT"};
    return names;
}

NdArray extract_pmf(const std::string& name, const NdArray& mat6)
{
    if (mat6.ndim() != 6)
        throw std::invalid_argument("extract_pmf: expected a (T, Ma, D, Lo, La, E) matrix");
    if (name == "TRT")
        return agg_over_axes(mat6, {1, 2, 3, 4, 5});
    if (name == "Lon_Lat_TRT")
        return roll_first_axis_last(agg_over_axes(mat6, {1, 2, 5}));

    const NdArray agg = agg_over_axes(mat6, {0}); // (Ma, D, Lo, La, E)
    if (name == "Mag")
        return agg_over_axes(agg, {1, 2, 3, 4});
    if (name == "Dist")
        return agg_over_axes(agg, {0, 2, 3, 4});
    if (name == "Mag_Dist")
        return agg_over_axes(agg, {2, 3, 4});
    if (name == "Mag_Dist_Eps")
        return agg_over_axes(agg, {2, 3});
    if (name == "Lon_Lat")
        return agg_over_axes(agg, {0, 1, 4});
    if (name == "Mag_Lon_Lat")
        return agg_over_axes(agg, {1, 4});
    throw ConfigError("Unknown disaggregation output: " + name);
}

std::vector<double> PmfGroup::poe_agg() const
{
    std::vector<double> out;
    out.reserve(pmfs.size());
    for (const auto& p : pmfs)
        out.push_back(p.poe_agg);
    return out;
}

std::string pmf_group_path(int sid, const RlzRef& rlz, const std::string& imt, std::size_t p)
{
    return "disagg/" + rlz.prefix() + imt + "-sid-" + std::to_string(sid) + "-poe-" +
           std::to_string(p);
}

std::vector<Pmf> extract_pmfs(const NdArray& mat6, const std::vector<std::string>& names)
{
    std::vector<Pmf> out;
    for (const auto& name : pmf_names())
    {
        if (!names.empty() && std::find(names.begin(), names.end(), name) == names.end())
            continue;
        NdArray pmf = extract_pmf(name, mat6);
        if (!pmf.any())
            continue;
        const double agg = poe_agg(pmf.span());
        out.push_back({name, std::move(pmf), agg});
    }
    return out;
}

NdArray slice_pz(const NdArray& mat8, std::size_t p, std::size_t z)
{
    const auto& s = mat8.shape();
    const std::size_t P = s[6], Z = s[7];
    NdArray out(NdArray::Shape(s.begin(), s.begin() + 6));
    for (std::size_t i = 0; i < out.size(); ++i)
        out[i] = mat8[(i * P + p) * Z + z];
    return out;
}

static void check_poe_agg(const PmfGroup& g, const std::vector<bool>& ok)
{
    if (!g.poe || !ok[static_cast<std::size_t>(g.site_id)])
        return;
    for (const auto& pmf : g.pmfs)
        if (std::abs(1.0 - pmf.poe_agg / *g.poe) > 0.1)
            LOGW("Site #%d: poe_agg=%g of %s is quite different from the expected poe=%g; "
                 "perhaps the number of intensity measure levels is too small?\n",
                 g.site_id, pmf.poe_agg, pmf.name.c_str(), *g.poe);
}

std::vector<PmfGroup> build_pmf_groups(const std::map<Accumulator::Key, NdArray>& mat8s,
                                       const PmfInputs& in)
{
    std::vector<bool> ok(in.sites.size(), false);
    for (int sid : in.ok_sites)
        ok[static_cast<std::size_t>(sid)] = true;

    std::vector<PmfGroup> groups;
    for (const auto& [key, mat8] : mat8s)
    {
        const std::size_t m = key.first;
        const int sid = key.second;
        const auto s = static_cast<std::size_t>(sid);
        const auto rlzs = in.rlzs.row(s);
        const std::size_t Z = rlzs.size();
        const std::string& imt = in.imtls.name(m);
        const auto& site = in.sites[s];

        std::vector<double> w(Z, 1.0);
        if (Z > 1)
        {
            double tot = 0.0;
            for (std::size_t z = 0; z < Z; ++z)
                tot += w[z] = in.weights.at({static_cast<std::size_t>(rlzs[z]), m});
            for (auto& x : w)
                x = tot > 0.0 ? x / tot : 1.0 / double(Z);
        }

        auto make_group = [&](const RlzRef& ref, std::size_t p, const NdArray& mat6)
        {
            PmfGroup g;
            g.path = pmf_group_path(sid, ref, imt, p);
            g.site_id = sid;
            g.rlz = ref;
            g.poe = in.poes[p];
            g.poe_index = p;
            g.imti = m;
            g.imt = imt;
            if (!ref.is_mean())
            {
                auto it = in.imldic.find({sid, ref.id, p, m});
                if (it != in.imldic.end())
                    g.iml = it->second;
            }
            g.location = {site.lon, site.lat};
            g.pmfs = extract_pmfs(mat6, in.outputs);
            check_poe_agg(g, ok);
            groups.push_back(std::move(g));
        };

        for (std::size_t p = 0; p < in.poes.size(); ++p)
        {
            NdArray mean;
            for (std::size_t z = 0; z < Z; ++z)
            {
                NdArray mat6 = slice_pz(mat8, p, z);
                if (Z > 1)
                {
                    if (mean.empty())
                        mean = NdArray(mat6.shape());
                    for (std::size_t i = 0; i < mat6.size(); ++i)
                        mean[i] += w[z] * mat6[i];
                }
                if (mat6.any())
                    make_group(RlzRef::indexed(rlzs[z]), p, mat6);
            }
            if (Z > 1 && mean.any())
                make_group(RlzRef::mean(), p, mean);
        }
    }
    return groups;
}

} // namespace hazard
