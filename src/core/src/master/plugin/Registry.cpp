#include "master/plugin/Registry.hpp"
#include "Errors.hpp"
#include <algorithm>

using namespace disagg::master::plugin;

std::vector<std::string> Registry::gmm_keys() const
{
    std::vector<std::string> keys;
    keys.reserve(gmms_.size());
    for (const auto& kv : gmms_)
        keys.push_back(kv.first);
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::shared_ptr<const hazard::IGroundMotionModel>
Registry::make_gmm(const std::string& key, const KV& kv, const disagg::master::RunContext& rc) const
{
    auto it = gmms_.find(key);
    if (it == gmms_.end())
        throw hazard::ConfigError("No ground-motion model factory for key: " + key);
    return it->second(kv, rc);
}
