#pragma once
#include <cstddef>
#include <span>
#include <string>
#include <utility>
#include <vector>

/**
 * @file Imt.hpp
 * @brief Intensity measure types and their ordered intensity levels.
 *
 * @details
 * :cpp:struct:`hazard::Imt` parses ``PGA``, ``PGV`` and ``SA(T)``. :cpp:class:`hazard::Imtls`
 * keeps the IMTs in configuration order together with their levels; hazard curves are stored
 * flattened in that order, so ``slice(m)`` is the ``[offset, offset + levels)`` window of IMT
 * ``m`` inside a curve.
 */

namespace hazard
{

struct Imt
{
    std::string name; // canonical string, e.g. "SA(0.2)"
    std::string kind; // PGA | PGV | SA
    double period = 0.0;

    static Imt parse(const std::string& s);
};

class Imtls
{
  public:
    void add(const std::string& imt, std::vector<double> levels);

    std::size_t size() const noexcept { return imts_.size(); }
    bool empty() const noexcept { return imts_.empty(); }
    const Imt& imt(std::size_t m) const { return imts_.at(m); }
    const std::string& name(std::size_t m) const { return imts_.at(m).name; }
    std::span<const double> levels(std::size_t m) const { return levels_.at(m); }
    std::size_t offset(std::size_t m) const { return offsets_.at(m); }
    std::size_t num_levels() const noexcept { return total_; }

    // Index of `imt` or npos
    std::size_t index(const std::string& imt) const noexcept;
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    // Throws DataError unless `curve` has num_levels() values; `what` names the curve
    void check_curve(std::span<const double> curve, const std::string& what) const;

    // Window of IMT m inside a flattened curve of num_levels() values
    std::span<const double> slice(std::span<const double> curve, std::size_t m) const;

  private:
    std::vector<Imt> imts_;
    std::vector<std::vector<double>> levels_;
    std::vector<std::size_t> offsets_;
    std::size_t total_ = 0;
};

} // namespace hazard
