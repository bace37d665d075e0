#include "GroundMotion.hpp"
#include "Errors.hpp"
#include <array>
#include <utility>

namespace hazard
{

RuptureContext RuptureContext::from_columns(const std::map<std::string, double>& cols,
                                            PoissonTOM tom)
{
    RuptureContext ctx;
    ctx.tom = tom;
    const std::array<std::pair<const char*, double*>, 9> fields{{
        {"mag", &ctx.mag},
        {"rake", &ctx.rake},
        {"hypo_depth", &ctx.hypo_depth},
        {"occurrence_rate", &ctx.occurrence_rate},
        {"rrup", &ctx.rrup},
        {"rjb", &ctx.rjb},
        {"lon", &ctx.lon},
        {"lat", &ctx.lat},
        {"vs30", &ctx.vs30},
    }};
    for (const auto& [key, dst] : fields)
    {
        auto it = cols.find(key);
        if (it == cols.end())
            throw ConfigError(std::string("Missing rupture column: ") + key);
        *dst = it->second;
    }
    if (cols.size() != fields.size())
    {
        for (const auto& kv : cols)
        {
            bool known = false;
            for (const auto& f : fields)
                known = known || kv.first == f.first;
            if (!known)
                throw ConfigError("Unknown rupture column: " + kv.first);
        }
    }
    return ctx;
}

} // namespace hazard
