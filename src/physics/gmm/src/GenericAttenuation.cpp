#include "GenericAttenuation.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <vector>

using disagg::master::plugin::KV;

namespace gmm
{

static double to_d(const std::string& key, const std::string& s)
{
    char* e = nullptr;
    const double v = std::strtod(s.c_str(), &e);
    if (s.empty() || !e || *e != 0)
        throw hazard::ConfigError("[gmm.generic_attenuation] not a number: " + key + "=" + s);
    return v;
}

static double* field(Coeffs& c, const std::string& k)
{
    if (k == "c0")
        return &c.c0;
    if (k == "c1")
        return &c.c1;
    if (k == "c2")
        return &c.c2;
    if (k == "c3")
        return &c.c3;
    if (k == "c4")
        return &c.c4;
    if (k == "h")
        return &c.h;
    if (k == "sigma")
        return &c.sigma;
    return nullptr;
}

GenericAttenuation::GenericAttenuation(const KV& kv)
{
    // plain keys first so that overrides start from the final base values
    std::vector<std::pair<std::string, std::string>> overrides;
    for (const auto& [key, value] : kv)
    {
        const auto at = key.find('@');
        if (at != std::string::npos)
        {
            overrides.emplace_back(key, value);
            continue;
        }
        double* dst = field(base_, key);
        if (!dst)
            throw hazard::ConfigError("[gmm.generic_attenuation] unknown parameter: " + key);
        *dst = to_d(key, value);
    }
    for (const auto& [key, value] : overrides)
    {
        const auto at = key.find('@');
        const std::string imt = hazard::Imt::parse(key.substr(at + 1)).name;
        auto it = by_imt_.try_emplace(imt, base_).first;
        double* dst = field(it->second, key.substr(0, at));
        if (!dst)
            throw hazard::ConfigError("[gmm.generic_attenuation] unknown parameter: " + key);
        *dst = to_d(key, value);
    }

    auto validate = [](const Coeffs& c, const std::string& where)
    {
        if (!(c.sigma > 0.0))
            throw hazard::ConfigError("[gmm.generic_attenuation] sigma must be > 0" + where);
        if (!(c.h >= 0.0))
            throw hazard::ConfigError("[gmm.generic_attenuation] h must be >= 0" + where);
    };
    validate(base_, "");
    for (const auto& [imt, c] : by_imt_)
        validate(c, " for " + imt);
}

const Coeffs& GenericAttenuation::coeffs(const std::string& imt) const
{
    auto it = by_imt_.find(imt);
    return it == by_imt_.end() ? base_ : it->second;
}

hazard::MeanStd GenericAttenuation::mean_std(const hazard::RuptureContext& ctx,
                                             const hazard::Imt& imt) const
{
    const Coeffs& c = coeffs(imt.name);
    const double dm = ctx.mag - 6.0;
    const double r = std::sqrt(ctx.rrup * ctx.rrup + c.h * c.h);
    hazard::MeanStd ms;
    ms.mean = c.c0 + c.c1 * dm + c.c2 * dm * dm + c.c3 * std::log(std::max(r, 1e-3)) +
              c.c4 * std::log(ctx.vs30 / 760.0);
    ms.sigma = c.sigma;
    return ms;
}

std::shared_ptr<const hazard::IGroundMotionModel> make_generic_attenuation(const KV& kv)
{
    return std::make_shared<GenericAttenuation>(kv);
}

} // namespace gmm
