#include "NdArray.hpp"
#include <algorithm>
#include <stdexcept>

namespace hazard
{

static std::vector<std::size_t> row_major_strides(const NdArray::Shape& shape)
{
    std::vector<std::size_t> st(shape.size(), 1);
    for (std::size_t d = shape.size(); d-- > 1;)
        st[d - 1] = st[d] * shape[d];
    return st;
}

std::size_t NdArray::element_count(const Shape& shape) noexcept
{
    std::size_t n = 1;
    for (auto s : shape)
        n *= s;
    return n;
}

NdArray::NdArray(Shape shape, double fill)
    : shape_(std::move(shape)), strides_(row_major_strides(shape_)),
      data_(element_count(shape_), fill)
{
}

std::size_t NdArray::offset(std::initializer_list<std::size_t> idx) const noexcept
{
    std::size_t off = 0, d = 0;
    for (auto i : idx)
        off += i * strides_[d++];
    return off;
}

NdArray NdArray::sub(std::size_t i) const
{
    if (shape_.empty() || i >= shape_[0])
        throw std::out_of_range("NdArray::sub: index out of range");
    NdArray out(Shape(shape_.begin() + 1, shape_.end()));
    const std::size_t n = out.size();
    std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(i * n), n, out.data_.begin());
    return out;
}

bool NdArray::any() const noexcept
{
    return std::any_of(data_.begin(), data_.end(), [](double v) { return v != 0.0; });
}

double NdArray::sum() const noexcept
{
    double s = 0.0;
    for (double v : data_)
        s += v;
    return s;
}

void NdArray::fill(double v) noexcept
{
    std::fill(data_.begin(), data_.end(), v);
}

NdArray agg_over_axes(const NdArray& a, const std::vector<std::size_t>& axes)
{
    const auto& shape = a.shape();
    std::vector<bool> reduced(shape.size(), false);
    for (auto ax : axes)
    {
        if (ax >= shape.size())
            throw std::out_of_range("agg_over_axes: axis out of range");
        reduced[ax] = true;
    }

    NdArray::Shape kept;
    for (std::size_t d = 0; d < shape.size(); ++d)
        if (!reduced[d])
            kept.push_back(shape[d]);

    // accumulate prod(1 - p) into the kept cells
    NdArray acc(kept, 1.0);
    const auto& ost = acc.strides();
    std::vector<std::size_t> out_stride(shape.size(), 0);
    for (std::size_t d = 0, k = 0; d < shape.size(); ++d)
        if (!reduced[d])
            out_stride[d] = ost[k++];

    std::vector<std::size_t> idx(shape.size(), 0);
    std::size_t o = 0;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        acc[o] *= 1.0 - a[i];
        // odometer increment, keeping the output offset in sync
        for (std::size_t d = shape.size(); d-- > 0;)
        {
            if (++idx[d] < shape[d])
            {
                o += out_stride[d];
                break;
            }
            o -= out_stride[d] * (shape[d] - 1);
            idx[d] = 0;
        }
    }
    for (std::size_t i = 0; i < acc.size(); ++i)
        acc[i] = 1.0 - acc[i];
    return acc;
}

NdArray roll_first_axis_last(const NdArray& a)
{
    if (a.ndim() < 2)
        return a;
    const auto& s = a.shape();
    NdArray::Shape out_shape(s.begin() + 1, s.end());
    out_shape.push_back(s[0]);
    NdArray out(out_shape);
    const std::size_t n0 = s[0];
    const std::size_t inner = a.size() / n0;
    for (std::size_t i = 0; i < n0; ++i)
        for (std::size_t j = 0; j < inner; ++j)
            out[j * n0 + i] = a[i * inner + j];
    return out;
}

} // namespace hazard
