#include "Params.hpp"
#include "Errors.hpp"
#include "PmfExtractor.hpp"
#include <algorithm>
#include <sstream>

namespace hazard
{

std::vector<std::optional<double>> CalcParams::poes() const
{
    if (!iml_disagg.empty())
        return {std::nullopt};
    return {poes_disagg.begin(), poes_disagg.end()};
}

std::optional<double> CalcParams::fixed_iml(const std::string& imt) const
{
    for (const auto& [name, iml] : iml_disagg)
        if (name == imt)
            return iml;
    return std::nullopt;
}

static void check_edges(const char* what, const std::optional<std::vector<double>>& e)
{
    if (!e)
        return;
    if (e->size() < 2)
        throw ConfigError(std::string("disagg_bin_edges.") + what + " needs at least 2 edges");
    for (std::size_t i = 1; i < e->size(); ++i)
        if (!((*e)[i] > (*e)[i - 1]))
            throw ConfigError(std::string("disagg_bin_edges.") + what +
                              " must be strictly increasing");
}

void CalcParams::validate() const
{
    if (imtls.empty())
        throw ConfigError("No intensity measure types configured (imtls)");
    if (poes_disagg.empty() && iml_disagg.empty())
        throw ConfigError("You must set either poes_disagg or iml_disagg");
    if (!poes_disagg.empty() && !iml_disagg.empty())
        throw ConfigError("poes_disagg and iml_disagg are mutually exclusive");
    for (double p : poes_disagg)
        if (!(p > 0.0 && p < 1.0))
        {
            std::ostringstream msg;
            msg << "poes_disagg must be in (0, 1), got " << p;
            throw ConfigError(msg.str());
        }
    for (const auto& [imt, iml] : iml_disagg)
    {
        if (imtls.index(imt) == Imtls::npos)
            throw ConfigError("iml_disagg refers to unknown IMT " + imt);
        if (!(iml > 0.0))
            throw ConfigError("iml_disagg[" + imt + "] must be positive");
    }
    if (!iml_disagg.empty() && iml_disagg.size() != imtls.size())
        throw ConfigError("iml_disagg must give one intensity for every IMT");
    if (!(truncation_level > 0.0))
        throw ConfigError("truncation_level must be positive for disaggregation");
    if (!(investigation_time > 0.0))
        throw ConfigError("investigation_time must be positive");
    if (num_epsilon_bins < 1)
        throw ConfigError("num_epsilon_bins must be >= 1");
    if (!(mag_bin_width > 0.0) || !(distance_bin_width > 0.0) || !(coordinate_bin_width > 0.0))
        throw ConfigError("bin widths must be positive");
    check_edges("mag", mag_edges);
    check_edges("dist", dist_edges);
    check_edges("eps", eps_edges);
    if (rlz_index && rlz_index->empty())
        throw ConfigError("rlz_index is empty");
    if (rlz_index)
        for (int r : *rlz_index)
            if (r < 0)
                throw ConfigError("rlz_index contains a negative index");
    if (num_rlzs_disagg < 1)
        throw ConfigError("num_rlzs_disagg must be >= 1");
    for (const auto& out : disagg_outputs)
    {
        const auto& names = pmf_names();
        if (std::find(names.begin(), names.end(), out) == names.end())
            throw ConfigError("Unknown disaggregation output: " + out);
    }
}

} // namespace hazard
