#include "RealizationSelector.hpp"
#include "Errors.hpp"
#include "master/Log.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>
#include <string>

namespace hazard
{

std::vector<double> mean_curve(const std::vector<std::vector<double>>& curves,
                               const NdArray& weights, const Imtls& imtls)
{
    const std::size_t L = imtls.num_levels();
    std::vector<double> mean(L, 0.0);
    for (std::size_t m = 0; m < imtls.size(); ++m)
    {
        double wsum = 0.0;
        for (std::size_t r = 0; r < curves.size(); ++r)
            wsum += weights.at({r, m});
        if (wsum <= 0.0)
            continue;
        const std::size_t off = imtls.offset(m), nl = imtls.levels(m).size();
        for (std::size_t r = 0; r < curves.size(); ++r)
        {
            const double w = weights.at({r, m}) / wsum;
            for (std::size_t l = off; l < off + nl; ++l)
                mean[l] += w * curves[r][l];
        }
    }
    return mean;
}

std::vector<std::size_t> closest_to_ref(const std::vector<std::vector<double>>& curves,
                                        std::span<const double> ref, double cutoff)
{
    std::vector<double> dist(curves.size(), 0.0);
    for (std::size_t r = 0; r < curves.size(); ++r)
    {
        double acc = 0.0;
        for (std::size_t l = 0; l < ref.size(); ++l)
        {
            const double d = std::log(std::max(curves[r][l], cutoff)) -
                             std::log(std::max(ref[l], cutoff));
            acc += d * d;
        }
        dist[r] = std::sqrt(acc);
    }
    std::vector<std::size_t> order(curves.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(),
                     [&](std::size_t a, std::size_t b) { return dist[a] < dist[b]; });
    return order;
}

RlzSelection select_realizations(const CalcParams& p, std::size_t N, std::size_t R,
                                 const NdArray& weights, const CurveGetter& get_curve)
{
    RlzSelection out;
    if (p.rlz_index)
    {
        const std::size_t Z = p.rlz_index->size();
        if (Z > R)
        {
            std::ostringstream msg;
            msg << "rlz_index selects " << Z << " realizations but the model has only " << R;
            throw ConfigError(msg.str());
        }
        for (int r : *p.rlz_index)
            if (static_cast<std::size_t>(r) >= R)
                throw ConfigError("rlz_index " + std::to_string(r) + " out of range (R=" +
                                  std::to_string(R) + ")");
        out.rlzs = RlzMatrix(N, Z);
        for (std::size_t s = 0; s < N; ++s)
            for (std::size_t z = 0; z < Z; ++z)
                out.rlzs(s, z) = (*p.rlz_index)[z];
        return out;
    }

    const std::size_t Z = static_cast<std::size_t>(p.num_rlzs_disagg);
    if (Z > R)
    {
        std::ostringstream msg;
        msg << "num_rlzs_disagg=" << Z << " exceeds the number of realizations " << R;
        throw ConfigError(msg.str());
    }
    out.rlzs = RlzMatrix(N, Z);
    if (R <= 1)
        return out;

    const std::size_t L = p.imtls.num_levels();
    for (std::size_t s = 0; s < N; ++s)
    {
        std::vector<std::vector<double>> curves;
        curves.reserve(R);
        for (std::size_t r = 0; r < R; ++r)
        {
            auto c = get_curve(static_cast<int>(s), static_cast<int>(r));
            if (c)
                p.imtls.check_curve(*c, "Hazard curve of site #" + std::to_string(s) +
                                            ", rlz #" + std::to_string(r));
            curves.push_back(c ? std::move(*c) : std::vector<double>(L, 0.0));
        }
        const auto mean = mean_curve(curves, weights, p.imtls);
        const auto order = closest_to_ref(curves, mean);
        for (std::size_t z = 0; z < Z; ++z)
            out.rlzs(s, z) = static_cast<int>(order[z]);
        LOGD("site #%zu: closest realization to the mean is #%zu\n", s, order.front());
    }
    out.by_closeness = true;
    return out;
}

} // namespace hazard
