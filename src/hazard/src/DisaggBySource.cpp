#include "DisaggBySource.hpp"
#include "Interpolate.hpp"
#include "Probability.hpp"
#include "master/Log.hpp"
#include <cmath>
#include <sstream>
#include <string>

namespace hazard
{

static std::string label(const CalcParams& params, const std::optional<double>& poe,
                         const std::string& imt)
{
    std::ostringstream os;
    if (poe)
        os << "poe-" << *poe;
    else
        os << "iml-" << params.fixed_iml(imt).value_or(0.0);
    return os.str();
}

std::vector<BySourceRecord> disagg_by_source(const CalcParams& params, const RlzMatrix& rlzs,
                                             const std::vector<Iml3>& iml3,
                                             std::size_t num_groups,
                                             const GroupCurveGetter& get_group_curve)
{
    LOGW("Disaggregation by source is experimental\n");
    const auto poes = params.poes();
    const auto& imtls = params.imtls;
    const std::size_t M = imtls.size(), P = poes.size(), G = num_groups;

    std::vector<BySourceRecord> out;
    for (std::size_t s = 0; s < rlzs.N(); ++s)
    {
        if (rlzs.Z() == 0)
            break;
        const int sid = static_cast<int>(s);
        const int rlz = rlzs(s, 0);
        NdArray contrib({M, P, G});
        for (std::size_t g = 0; g < G; ++g)
        {
            const auto pcurve = get_group_curve(sid, rlz, g);
            if (!pcurve)
                continue;
            imtls.check_curve(*pcurve, "Curve of group #" + std::to_string(g) + " at site #" +
                                           std::to_string(sid) + ", rlz #" + std::to_string(rlz));
            for (std::size_t m = 0; m < M; ++m)
            {
                const auto xs = imtls.levels(m);
                const auto ys = imtls.slice(*pcurve, m);
                for (std::size_t p = 0; p < P; ++p)
                {
                    const double iml = iml3.at(m).iml.at({s, p, 0});
                    if (std::isfinite(iml))
                        contrib.at({m, p, g}) = interp(iml, xs, ys);
                }
            }
        }
        for (std::size_t m = 0; m < M; ++m)
            for (std::size_t p = 0; p < P; ++p)
            {
                BySourceRecord rec;
                rec.poes.resize(G);
                double sum = 0.0;
                for (std::size_t g = 0; g < G; ++g)
                    sum += rec.poes[g] = contrib.at({m, p, g});
                if (sum == 0.0)
                    continue;
                rec.poe_agg = poe_agg(rec.poes);
                if (poes[p] && std::abs(1.0 - rec.poe_agg / *poes[p]) > 0.1)
                    LOGW("Site #%d, IMT=%s: poe_agg=%g is quite different from the expected "
                         "poe=%g\n",
                         sid, imtls.name(m).c_str(), rec.poe_agg, *poes[p]);
                rec.site_id = sid;
                rec.rlz = rlz;
                rec.imt = imtls.name(m);
                rec.path = "disagg_by_src/" + label(params, poes[p], rec.imt) + "-" + rec.imt +
                           "-sid-" + std::to_string(sid);
                out.push_back(std::move(rec));
            }
    }
    return out;
}

} // namespace hazard
