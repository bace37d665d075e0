#include "GenericAttenuation.hpp"
#include "master/RunContext.hpp"
#include "master/plugin/Registry.hpp"

using disagg::master::RunContext;
using disagg::master::plugin::KV;
using disagg::master::plugin::Registry;

extern "C" bool gmm_register_v1(Registry* R)
{
    if (!R)
        return false;

    R->add_gmm("generic_attenuation",
               [](const KV& kv, const RunContext&) { return gmm::make_generic_attenuation(kv); });

    return true;
}
