#include "Probability.hpp"
#include <stdexcept>
#include <string>

namespace hazard
{

double agg_probs(std::initializer_list<double> probs) noexcept
{
    double acc = 1.0;
    for (double p : probs)
        acc *= 1.0 - p;
    return 1.0 - acc;
}

void agg_probs_inplace(std::span<double> acc, std::span<const double> probs)
{
    if (acc.size() != probs.size())
        throw std::invalid_argument("agg_probs: size mismatch " + std::to_string(acc.size()) +
                                    " != " + std::to_string(probs.size()));
    for (std::size_t i = 0; i < acc.size(); ++i)
        acc[i] = 1.0 - (1.0 - acc[i]) * (1.0 - probs[i]);
}

NdArray agg_probs(const NdArray& a, const NdArray& b)
{
    if (a.shape() != b.shape())
        throw std::invalid_argument("agg_probs: shape mismatch");
    NdArray out = a;
    agg_probs_inplace(out.span(), b.span());
    return out;
}

double poe_agg(std::span<const double> probs) noexcept
{
    double acc = 1.0;
    for (double p : probs)
        acc *= 1.0 - p;
    return 1.0 - acc;
}

} // namespace hazard
