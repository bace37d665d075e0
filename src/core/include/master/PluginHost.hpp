#pragma once
#include "Disaggregator.hpp"
#include "master/plugin/Registry.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

/**
 * @file PluginHost.hpp
 * @brief Loader for ground-motion plugin libraries and registry owner.
 *
 * @details
 * The host owns the ``dlopen`` handles for its whole lifetime; models created from a plugin
 * must not outlive the host that loaded it.
 *
 * @warning On Linux the application must link with ``dl`` to resolve ELF loader calls.
 */

namespace disagg::master
{

struct RunContext;

/// One entry of the ``gmm:`` section: logic-tree name -> factory key + parameters.
struct GmmSpec
{
    std::string model;
    plugin::KV params;
};

class PluginHost
{
  public:
    PluginHost() = default;
    ~PluginHost();
    PluginHost(const PluginHost&) = delete;
    PluginHost& operator=(const PluginHost&) = delete;
    PluginHost(PluginHost&&) noexcept;
    PluginHost& operator=(PluginHost&&) noexcept;

    void load_library(const std::filesystem::path& lib);

    std::shared_ptr<const hazard::IGroundMotionModel>
    make_gmm(const std::string& key, const plugin::KV& cfg, const RunContext& rc) const;

    // One model per logic-tree GMM name
    hazard::GmmsByName make_gmms(const std::map<std::string, GmmSpec>& specs,
                                 const RunContext& rc) const;

    plugin::Registry& registry() noexcept { return reg_; }
    const plugin::Registry& registry() const noexcept { return reg_; }

  private:
    plugin::Registry reg_;
    std::vector<void*> handles_;
};

} // namespace disagg::master
