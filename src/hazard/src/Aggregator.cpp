#include "Aggregator.hpp"
#include "Probability.hpp"
#include <algorithm>
#include <stdexcept>

namespace hazard
{

void Accumulator::add(const Key& key, const BinKey& bin, const NdArray& probs)
{
    auto& mats = acc_[key];
    auto it = mats.find(bin);
    if (it == mats.end())
        mats.emplace(bin, probs);
    else
        agg_probs_inplace(it->second.span(), probs.span());
}

void Accumulator::add(PartialResult&& r)
{
    for (auto& [sid, mat] : r.by_site)
    {
        auto& mats = acc_[{r.imti, sid}];
        auto it = mats.find({r.trti, r.magi});
        if (it == mats.end())
            mats.emplace(BinKey{r.trti, r.magi}, std::move(mat));
        else
            agg_probs_inplace(it->second.span(), mat.span());
    }
}

std::size_t Accumulator::num_matrices() const noexcept
{
    std::size_t n = 0;
    for (const auto& kv : acc_)
        n += kv.second.size();
    return n;
}

NdArray matrix8(const Accumulator::Matrices& mats, std::size_t T, std::size_t Ma)
{
    if (mats.empty())
        throw std::invalid_argument("matrix8: no matrices");
    const auto& shape6 = mats.begin()->second.shape();
    NdArray::Shape shape{T, Ma};
    shape.insert(shape.end(), shape6.begin(), shape6.end());
    NdArray out(shape);
    const std::size_t block = NdArray::element_count(shape6);
    for (const auto& [bin, mat] : mats)
    {
        if (bin.first >= T || bin.second >= Ma || mat.size() != block)
            throw std::out_of_range("matrix8: partial result outside the (trt, mag) bins");
        std::copy(mat.data(), mat.data() + block,
                  out.data() + (bin.first * Ma + bin.second) * block);
    }
    return out;
}

std::map<Accumulator::Key, NdArray> assemble(const Accumulator& acc, std::size_t T,
                                             std::size_t Ma)
{
    std::map<Accumulator::Key, NdArray> out;
    for (const auto& [key, mats] : acc.results())
        out.emplace(key, matrix8(mats, T, Ma));
    return out;
}

} // namespace hazard
