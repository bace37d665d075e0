#pragma once
#include <cstddef>
#include <initializer_list>
#include <span>
#include <vector>

/**
 * @file NdArray.hpp
 * @brief Owning, row-major N-D array of doubles used for disaggregation matrices and PMFs.
 *
 * @details
 * The disaggregation tensors are small (the 6-D part is capped at one million elements), dense
 * and always `double`, so a single contiguous buffer with row-major strides is enough. The
 * reduction helpers combine probabilities with the independent-events rule
 * `1 - prod(1 - p)` instead of summing.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   NdArray mat6({T, Ma, D, Lo, La, E});
 *   mat6.at({t, m, d, lo, la, e}) = 0.25;
 *   NdArray mag = agg_over_axes(mat6, {0, 2, 3, 4, 5}); // shape (Ma)
 * @endrst
 */

namespace hazard
{

class NdArray
{
  public:
    using Shape = std::vector<std::size_t>;

    NdArray() = default;
    explicit NdArray(Shape shape, double fill = 0.0);

    const Shape& shape() const noexcept { return shape_; }
    std::size_t ndim() const noexcept { return shape_.size(); }
    std::size_t size() const noexcept { return data_.size(); }
    bool empty() const noexcept { return data_.empty(); }

    double* data() noexcept { return data_.data(); }
    const double* data() const noexcept { return data_.data(); }
    std::span<double> span() noexcept { return data_; }
    std::span<const double> span() const noexcept { return data_; }

    double& operator[](std::size_t i) noexcept { return data_[i]; }
    const double& operator[](std::size_t i) const noexcept { return data_[i]; }

    std::size_t offset(std::initializer_list<std::size_t> idx) const noexcept;
    double& at(std::initializer_list<std::size_t> idx) noexcept { return data_[offset(idx)]; }
    const double& at(std::initializer_list<std::size_t> idx) const noexcept
    {
        return data_[offset(idx)];
    }

    const std::vector<std::size_t>& strides() const noexcept { return strides_; }

    // Copy of the (ndim-1)-D block at index i of the first axis
    NdArray sub(std::size_t i) const;

    bool any() const noexcept;
    double sum() const noexcept;
    void fill(double v) noexcept;

    static std::size_t element_count(const Shape& shape) noexcept;

  private:
    Shape shape_;
    std::vector<std::size_t> strides_;
    std::vector<double> data_;
};

// 1 - prod(1 - a) over `axes`; the kept axes stay in their original order.
NdArray agg_over_axes(const NdArray& a, const std::vector<std::size_t>& axes);

// Move the first axis to the last position (e.g. (T, Lo, La) -> (Lo, La, T)).
NdArray roll_first_axis_last(const NdArray& a);

} // namespace hazard
