#include "Imt.hpp"
#include "Errors.hpp"
#include <cstdlib>
#include <sstream>

namespace hazard
{

Imt Imt::parse(const std::string& s)
{
    Imt imt;
    if (s == "PGA" || s == "PGV")
    {
        imt.name = s;
        imt.kind = s;
        return imt;
    }
    if (s.size() > 4 && s.rfind("SA(", 0) == 0 && s.back() == ')')
    {
        const std::string num = s.substr(3, s.size() - 4);
        char* end = nullptr;
        const double T = std::strtod(num.c_str(), &end);
        if (end && *end == 0 && T >= 0.0)
        {
            imt.kind = "SA";
            imt.period = T;
            imt.name = s;
            return imt;
        }
    }
    throw ConfigError("Unknown intensity measure type: '" + s + "'");
}

void Imtls::add(const std::string& imt, std::vector<double> levels)
{
    if (index(imt) != npos)
        throw ConfigError("Duplicate intensity measure type: " + imt);
    if (levels.empty())
        throw ConfigError("No intensity levels for " + imt);
    for (std::size_t i = 1; i < levels.size(); ++i)
        if (!(levels[i] > levels[i - 1]))
        {
            std::ostringstream msg;
            msg << "Intensity levels for " << imt << " must be strictly increasing (level #" << i
                << " = " << levels[i] << ")";
            throw ConfigError(msg.str());
        }
    imts_.push_back(Imt::parse(imt));
    offsets_.push_back(total_);
    total_ += levels.size();
    levels_.push_back(std::move(levels));
}

std::size_t Imtls::index(const std::string& imt) const noexcept
{
    for (std::size_t m = 0; m < imts_.size(); ++m)
        if (imts_[m].name == imt)
            return m;
    return npos;
}

void Imtls::check_curve(std::span<const double> curve, const std::string& what) const
{
    if (curve.size() != total_)
    {
        std::ostringstream msg;
        msg << what << " has " << curve.size() << " levels but the configured IMTs have "
            << total_;
        throw DataError(msg.str());
    }
}

std::span<const double> Imtls::slice(std::span<const double> curve, std::size_t m) const
{
    check_curve(curve, "curve");
    return curve.subspan(offsets_.at(m), levels_.at(m).size());
}

} // namespace hazard
