#include "master/PluginHost.hpp"
#include "master/Log.hpp"
#include "master/RunContext.hpp"
#include <stdexcept>
#include <utility>

/// \cond DOXYGEN_EXCLUDE
#include <dlfcn.h>

static void* load_so(const std::string& p)
{
    return ::dlopen(p.c_str(), RTLD_NOW | RTLD_LOCAL);
}
static void close_so(void* h)
{
    if (h)
        ::dlclose(h);
}
static void* load_sym(void* h, const char* s)
{
    return ::dlsym(h, s);
}
/// \endcond

using namespace disagg::master;

PluginHost::~PluginHost()
{
    for (void* h : handles_)
        close_so(h);
}

PluginHost::PluginHost(PluginHost&& o) noexcept
    : reg_(std::move(o.reg_)), handles_(std::move(o.handles_))
{
    o.handles_.clear();
}

PluginHost& PluginHost::operator=(PluginHost&& o) noexcept
{
    if (this != &o)
    {
        for (void* h : handles_)
            close_so(h);
        reg_ = std::move(o.reg_);
        handles_ = std::move(o.handles_);
        o.handles_.clear();
    }
    return *this;
}

void PluginHost::load_library(const std::filesystem::path& lib)
{
    auto* h = load_so(lib.string());
    if (!h)
    {
        const char* err = ::dlerror();
        throw std::runtime_error("Failed to load plugin library: " + lib.string() +
                                 (err ? std::string(" (") + err + ")" : std::string()));
    }
    handles_.push_back(h);

    auto* sym = load_sym(h, plugin::kRegisterSymbol);
    if (!sym)
        throw std::runtime_error("Missing symbol in plugin: " +
                                 std::string(plugin::kRegisterSymbol));
    auto reg_fn = reinterpret_cast<plugin::RegisterFn>(sym);
    if (!reg_fn(&reg_))
        throw std::runtime_error("Plugin registration returned failure: " + lib.string());
    LOGD("loaded plugin %s\n", lib.string().c_str());
}

std::shared_ptr<const hazard::IGroundMotionModel>
PluginHost::make_gmm(const std::string& key, const plugin::KV& cfg, const RunContext& rc) const
{
    return reg_.make_gmm(key, cfg, rc);
}

hazard::GmmsByName PluginHost::make_gmms(const std::map<std::string, GmmSpec>& specs,
                                         const RunContext& rc) const
{
    hazard::GmmsByName out;
    for (const auto& [name, spec] : specs)
    {
        out.emplace(name, reg_.make_gmm(spec.model, spec.params, rc));
        LOGD("gsim %s -> %s\n", name.c_str(), spec.model.c_str());
    }
    return out;
}
