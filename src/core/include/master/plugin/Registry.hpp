#pragma once
#include "GroundMotion.hpp"
#include "master/RunContext.hpp"
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @file Registry.hpp
 * @brief Runtime factory registry for ground-motion models.
 *
 * @details
 * Shared libraries register factories under string keys using the exported function
 * :cpp:func:`gmm_register_v1`. The application resolves keys from the ``gmm`` section of the
 * YAML file and constructs one model instance per logic-tree GMM name.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   extern "C" bool gmm_register_v1(Registry* R) {
 *     R->add_gmm("generic_attenuation", [](const KV& kv, const RunContext&) {
 *       return std::make_shared<GenericAttenuation>(kv);
 *     });
 *     return true;
 *   }
 * @endrst
 */

namespace disagg::master::plugin
{

/// Free-form string parameters handed to a factory.
using KV = std::unordered_map<std::string, std::string>;

class Registry
{
  public:
    using CreateGmm = std::function<std::shared_ptr<const hazard::IGroundMotionModel>(
        const KV&, const disagg::master::RunContext&)>;

    void add_gmm(std::string key, CreateGmm f) { gmms_[std::move(key)] = std::move(f); }
    bool has_gmm(const std::string& key) const { return gmms_.count(key) != 0; }
    std::vector<std::string> gmm_keys() const;

    std::shared_ptr<const hazard::IGroundMotionModel>
    make_gmm(const std::string& key, const KV&, const disagg::master::RunContext&) const;

  private:
    std::unordered_map<std::string, CreateGmm> gmms_;
};

// Plugin entry point
using RegisterFn = bool (*)(Registry*);
inline constexpr const char* kRegisterSymbol = "gmm_register_v1";

} // namespace disagg::master::plugin
