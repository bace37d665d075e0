#pragma once
#include "GroundMotion.hpp"
#include "master/plugin/Registry.hpp"
#include <map>
#include <memory>
#include <string>

/**
 * @file GenericAttenuation.hpp
 * @brief Parametric attenuation relation registered as ``generic_attenuation``.
 *
 * @details
 * @rst
 * .. math::
 *
 *    \ln Y = c_0 + c_1 (M - 6) + c_2 (M - 6)^2
 *            + c_3 \ln\sqrt{R_{rup}^2 + h^2} + c_4 \ln(V_{s30} / 760)
 *
 * with a constant total standard deviation :math:`\sigma`. Every coefficient can be given
 * for all IMTs (``c0``) and overridden for one IMT (``c0@SA(0.2)``); the IMT after ``@``
 * must be a valid name and is matched verbatim.
 *
 * .. code-block:: yaml
 *
 *    gmm:
 *      Generic2024:
 *        model: generic_attenuation
 *        params: {c0: "1.0", c3: "-1.2", sigma: "0.65", "c0@PGV": "4.1"}
 * @endrst
 */

namespace gmm
{

struct Coeffs
{
    double c0 = 1.0;
    double c1 = 0.9;
    double c2 = -0.1;
    double c3 = -1.2;
    double c4 = -0.5;
    double h = 6.0; // km
    double sigma = 0.65;
};

class GenericAttenuation final : public hazard::IGroundMotionModel
{
  public:
    explicit GenericAttenuation(const disagg::master::plugin::KV& kv);

    const char* name() const override { return "generic_attenuation"; }
    hazard::MeanStd mean_std(const hazard::RuptureContext& ctx,
                             const hazard::Imt& imt) const override;

    const Coeffs& coeffs(const std::string& imt) const;

  private:
    Coeffs base_;
    std::map<std::string, Coeffs> by_imt_;
};

std::shared_ptr<const hazard::IGroundMotionModel>
make_generic_attenuation(const disagg::master::plugin::KV& kv);

} // namespace gmm
