#include "IntensityResolver.hpp"
#include "Errors.hpp"
#include "Interpolate.hpp"
#include "master/Log.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <string>

namespace hazard
{

static constexpr const char* kPoeTooBig =
    "Site #%d: you are trying to disaggregate for poe=%g.\n"
    "However the source model produces at most probabilities\n"
    "of %.7f for rlz=#%d, IMT=%s.\n"
    "The disaggregation PoE is too big or your model is wrong,\n"
    "producing too small PoEs.\n";

Curves read_curves(const RlzMatrix& rlzs, const Imtls& imtls, const CurveGetter& get_curve)
{
    Curves curves(rlzs.N());
    for (std::size_t s = 0; s < rlzs.N(); ++s)
    {
        curves[s].reserve(rlzs.Z());
        for (std::size_t z = 0; z < rlzs.Z(); ++z)
        {
            auto c = get_curve(static_cast<int>(s), rlzs(s, z));
            if (c)
                imtls.check_curve(*c, "Hazard curve of site #" + std::to_string(s) + ", rlz #" +
                                          std::to_string(rlzs(s, z)));
            curves[s].push_back(std::move(c));
        }
    }
    return curves;
}

static bool check_site(int sid, std::span<const int> rlzs,
                       const std::vector<std::optional<std::vector<double>>>& curves,
                       const Imtls& imtls, const std::vector<double>& poes)
{
    bool bad = false;
    for (std::size_t z = 0; z < curves.size(); ++z)
    {
        if (!curves[z])
            continue;
        for (std::size_t m = 0; m < imtls.size(); ++m)
        {
            const auto c = imtls.slice(*curves[z], m);
            const double max_poe = *std::max_element(c.begin(), c.end());
            for (double poe : poes)
                if (poe > max_poe)
                {
                    LOGW(kPoeTooBig, sid, poe, max_poe, rlzs[z], imtls.name(m).c_str());
                    bad = true;
                }
        }
    }
    return bad;
}

std::vector<int> check_poes_disagg(const Curves& curves, const RlzMatrix& rlzs,
                                   const Imtls& imtls, const std::vector<double>& poes)
{
    std::vector<int> ok_sites;
    for (std::size_t s = 0; s < curves.size(); ++s)
    {
        const int sid = static_cast<int>(s);
        const bool none = std::all_of(curves[s].begin(), curves[s].end(),
                                      [](const auto& c) { return !c.has_value(); });
        if (none || !check_site(sid, rlzs.row(s), curves[s], imtls, poes))
            ok_sites.push_back(sid);
    }
    if (ok_sites.empty())
        throw DataError("Cannot do any disaggregation");
    if (ok_sites.size() < curves.size())
    {
        std::string list;
        for (int sid : ok_sites)
            list += (list.empty() ? "" : " ") + std::to_string(sid);
        LOGW("Doing the disaggregation on %zu of %zu sites: [%s]\n", ok_sites.size(),
             curves.size(), list.c_str());
    }
    return ok_sites;
}

std::vector<Iml3> build_iml3(const RlzMatrix& rlzs, const CalcParams& params,
                             const Curves& curves)
{
    const auto poes = params.poes();
    const std::size_t N = rlzs.N(), Z = rlzs.Z(), P = poes.size();
    const auto& imtls = params.imtls;
    std::vector<Iml3> out;
    out.reserve(imtls.size());
    for (std::size_t m = 0; m < imtls.size(); ++m)
    {
        Iml3 x{NdArray({N, P, Z}, std::numeric_limits<double>::quiet_NaN()), imtls.imt(m), m};
        const auto fixed = params.fixed_iml(imtls.name(m));
        const auto levels = imtls.levels(m);
        std::vector<double> imls_rev(levels.rbegin(), levels.rend());
        for (std::size_t s = 0; s < N; ++s)
            for (std::size_t z = 0; z < Z; ++z)
            {
                if (fixed)
                {
                    x.iml.at({s, 0, z}) = *fixed;
                    continue;
                }
                const auto& curve = curves.at(s).at(z);
                if (!curve)
                    continue;
                const auto c = imtls.slice(*curve, m);
                std::vector<double> poes_rev(c.rbegin(), c.rend());
                for (std::size_t p = 0; p < P; ++p)
                    x.iml.at({s, p, z}) = interp(*poes[p], poes_rev, imls_rev);
            }
        out.push_back(std::move(x));
    }
    return out;
}

ResolvedIntensities resolve_intensities(const CalcParams& params, const RlzMatrix& rlzs,
                                        const CurveGetter& get_curve)
{
    ResolvedIntensities r;
    const std::size_t N = rlzs.N(), Z = rlzs.Z();
    Curves curves;
    if (!params.iml_disagg.empty())
    {
        // no hazard curves needed
        curves.assign(N, std::vector<std::optional<std::vector<double>>>(Z));
        r.ok_sites.resize(N);
        std::iota(r.ok_sites.begin(), r.ok_sites.end(), 0);
    }
    else
    {
        curves = read_curves(rlzs, params.imtls, get_curve);
        r.ok_sites = check_poes_disagg(curves, rlzs, params.imtls, params.poes_disagg);
    }
    r.iml3 = build_iml3(rlzs, params, curves);

    std::vector<bool> ok(N, false);
    for (int sid : r.ok_sites)
        ok[static_cast<std::size_t>(sid)] = true;
    for (auto& x : r.iml3)
    {
        const std::size_t P = x.iml.shape()[1];
        for (std::size_t s = 0; s < N; ++s)
            for (std::size_t p = 0; p < P; ++p)
                for (std::size_t z = 0; z < Z; ++z)
                {
                    if (!ok[s])
                        x.iml.at({s, p, z}) = std::numeric_limits<double>::quiet_NaN();
                    r.imldic[{static_cast<int>(s), rlzs(s, z), p, x.imti}] = x.iml.at({s, p, z});
                }
    }
    return r;
}

} // namespace hazard
