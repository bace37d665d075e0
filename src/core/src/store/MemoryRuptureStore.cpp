#include "store/MemoryRuptureStore.hpp"
#include "Errors.hpp"
#include <stdexcept>

namespace disagg::store
{

namespace
{

class MemoryRuptureReader final : public hazard::IRuptureReader
{
  public:
    explicit MemoryRuptureReader(const hazard::RuptureColumns& cols) : cols_(cols) {}

    hazard::RuptureColumns read(std::span<const std::size_t> idxs) override
    {
        hazard::RuptureColumns out;
        for (const auto& [name, col] : cols_)
        {
            hazard::Column c;
            c.ncols = col.ncols;
            c.values.reserve(idxs.size() * col.ncols);
            for (std::size_t u : idxs)
                for (std::size_t j = 0; j < col.ncols; ++j)
                    c.values.push_back(col.at(u, j));
            out.emplace(name, std::move(c));
        }
        return out;
    }

  private:
    const hazard::RuptureColumns& cols_;
};

} // namespace

hazard::NdArray MemoryRuptureStore::weights(const hazard::Imtls& imtls) const
{
    hazard::NdArray w({rlz_weights.size(), imtls.size()});
    for (std::size_t r = 0; r < rlz_weights.size(); ++r)
        for (std::size_t m = 0; m < imtls.size(); ++m)
            w.at({r, m}) = rlz_weights[r];
    return w;
}

std::size_t MemoryRuptureStore::num_ruptures() const
{
    auto it = columns.find("mag");
    return it == columns.end() ? 0 : it->second.rows();
}

std::vector<double> MemoryRuptureStore::rupture_mags() const
{
    auto it = columns.find("mag");
    if (it == columns.end())
        throw hazard::DataError("Missing rupture column: mag");
    return it->second.values;
}

std::optional<std::vector<double>> MemoryRuptureStore::curve(int sid, int rlz) const
{
    auto it = hcurves.find({sid, rlz});
    if (it == hcurves.end())
        return std::nullopt;
    return it->second;
}

std::optional<std::vector<double>> MemoryRuptureStore::group_curve(int sid, int rlz,
                                                                   std::size_t gidx) const
{
    auto it = pcurves.find({sid, rlz, gidx});
    if (it == pcurves.end())
        return std::nullopt;
    return it->second;
}

std::unique_ptr<hazard::IRuptureReader> MemoryRuptureStore::open_reader() const
{
    return std::make_unique<MemoryRuptureReader>(columns);
}

} // namespace disagg::store
