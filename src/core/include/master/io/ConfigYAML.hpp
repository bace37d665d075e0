#pragma once
#include <cctype>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "Errors.hpp"
#include "Params.hpp"
#include "master/PluginHost.hpp"
#include "master/io/WriterConfig.hpp"

/**
 * @file   ConfigYAML.hpp
 * @brief  YAML → AppConfig loader and schema for the disaggregation app.
 *
 * @details
 * @rst
 * This file defines:
 *
 * - :cpp:struct:`AppConfig`: the strongly-typed config object (input, calculation, gmm, io…)
 * - :cpp:func:`load_config_from_yaml`: loader that parses a YAML file into :cpp:struct:`AppConfig`
 *
 * **Schema (v1)**
 *
 * .. code-block:: yaml
 *
 *    case: <string>                 # case name (output file is <io.path>/<case>.h5)
 *
 *    input:
 *      store: model.h5              # rupture store written by the hazard calculation
 *
 *    calculation:
 *      investigation_time: 50.0     # years
 *      truncation_level: 3.0        # > 0
 *      maximum_distance: 200        # km; or {default: 200, "Active Shallow Crust": 300}
 *      mag_bin_width: 0.5
 *      distance_bin_width: 10.0
 *      coordinate_bin_width: 1.0    # degrees
 *      num_epsilon_bins: 3
 *      disagg_bin_edges:            # optional, overrides the widths
 *        mag: [5.0, 6.0, 7.0]
 *      imtls:                       # IMT -> increasing levels (document order is kept)
 *        PGA: [0.01, 0.1, 0.5]
 *      poes_disagg: [0.1]           # either this ...
 *      # iml_disagg: {PGA: 0.2}     # ... or fixed intensities, one per IMT
 *      rlz_index: [0]               # optional; else num_rlzs_disagg closest to the mean
 *      num_rlzs_disagg: 1
 *      max_sites_disagg: 10
 *      disagg_outputs: [Mag, Mag_Dist]  # default: all
 *      disagg_by_src: false
 *      concurrent_tasks: 0          # 0 = 2 x ranks x threads
 *      max_data_transfer: 2.0e+11   # bytes
 *
 *    gmm:                           # logic-tree GMM name -> registered model
 *      BooreAtkinson2008:
 *        model: generic_attenuation
 *        params: {c0: "-0.5", "c0@SA(0.2)": "0.1"}
 *
 *    plugins:
 *      - lib: libgmm_builtin.so     # GMM DSOs to load (in order)
 *
 *    io:
 *      backend: hdf5                # hdf5 | null
 *      path: out
 *      async:
 *        enabled: false
 *        max_queue: 16              # 0 = unbounded; a full queue blocks
 *
 *    threads: 0                     # OpenMP threads per rank, 0 = OMP default
 *
 * **Semantics**
 *
 * - Missing keys keep the defaults of :cpp:struct:`hazard::CalcParams`.
 * - The loaded parameters are validated; inconsistent settings raise
 *   :cpp:struct:`hazard::ConfigError`.
 * @endrst
 */

struct AppConfig
{
    std::string case_name = "disagg";
    std::string store_path;

    hazard::CalcParams calc;

    std::map<std::string, disagg::master::GmmSpec> gmms;
    std::vector<std::string> plugin_libs{};

    disagg::master::io::WriterConfig io;
    int threads = 0;
};

static inline std::string to_lower(std::string s)
{
    for (auto& c : s)
        c = (char) std::tolower((unsigned char) c);
    return s;
}

static inline disagg::master::io::WriterConfig::Backend parse_backend(const std::string& s)
{
    auto v = to_lower(s);
    if (v == "hdf5" || v == "h5")
        return disagg::master::io::WriterConfig::Backend::Hdf5;
    if (v == "null" || v == "none")
        return disagg::master::io::WriterConfig::Backend::Null;
    throw hazard::ConfigError("Unknown io.backend: " + s);
}

static inline std::optional<std::vector<double>> parse_edges(const YAML::Node& n)
{
    if (!n)
        return std::nullopt;
    return n.as<std::vector<double>>();
}

inline void load_calculation(const YAML::Node& c, hazard::CalcParams& p)
{
    if (auto n = c["investigation_time"])
        p.investigation_time = n.as<double>();
    if (auto n = c["truncation_level"])
        p.truncation_level = n.as<double>();
    if (auto n = c["maximum_distance"])
    {
        if (n.IsMap())
        {
            for (auto it = n.begin(); it != n.end(); ++it)
            {
                const auto key = it->first.as<std::string>();
                if (key == "default")
                    p.maximum_distance.default_km = it->second.as<double>();
                else
                    p.maximum_distance.by_trt[key] = it->second.as<double>();
            }
        }
        else
            p.maximum_distance.default_km = n.as<double>();
    }
    if (auto n = c["mag_bin_width"])
        p.mag_bin_width = n.as<double>();
    if (auto n = c["distance_bin_width"])
        p.distance_bin_width = n.as<double>();
    if (auto n = c["coordinate_bin_width"])
        p.coordinate_bin_width = n.as<double>();
    if (auto n = c["num_epsilon_bins"])
        p.num_epsilon_bins = n.as<int>();
    if (auto e = c["disagg_bin_edges"])
    {
        p.mag_edges = parse_edges(e["mag"]);
        p.dist_edges = parse_edges(e["dist"]);
        p.eps_edges = parse_edges(e["eps"]);
    }
    if (auto I = c["imtls"])
    {
        for (auto it = I.begin(); it != I.end(); ++it)
            p.imtls.add(it->first.as<std::string>(), it->second.as<std::vector<double>>());
    }
    if (auto n = c["poes_disagg"])
        p.poes_disagg = n.as<std::vector<double>>();
    if (auto n = c["iml_disagg"])
    {
        for (auto it = n.begin(); it != n.end(); ++it)
            p.iml_disagg.emplace_back(it->first.as<std::string>(), it->second.as<double>());
    }
    if (auto n = c["rlz_index"])
    {
        if (n.IsSequence())
            p.rlz_index = n.as<std::vector<int>>();
        else
            p.rlz_index = std::vector<int>{n.as<int>()};
    }
    if (auto n = c["num_rlzs_disagg"])
        p.num_rlzs_disagg = n.as<int>();
    if (auto n = c["max_sites_disagg"])
        p.max_sites_disagg = n.as<std::size_t>();
    if (auto n = c["disagg_outputs"])
        p.disagg_outputs = n.as<std::vector<std::string>>();
    if (auto n = c["disagg_by_src"])
        p.disagg_by_src = n.as<bool>();
    if (auto n = c["concurrent_tasks"])
        p.concurrent_tasks = n.as<int>();
    if (auto n = c["max_data_transfer"])
        p.max_data_transfer = n.as<double>();
}

inline AppConfig load_config_from_node(const YAML::Node& root)
{
    AppConfig cfg;

    if (auto n = root["case"])
        cfg.case_name = n.as<std::string>();

    if (auto in = root["input"])
    {
        if (auto n = in["store"])
            cfg.store_path = n.as<std::string>();
    }

    if (auto c = root["calculation"])
        load_calculation(c, cfg.calc);

    if (auto G = root["gmm"])
    {
        for (auto it = G.begin(); it != G.end(); ++it)
        {
            disagg::master::GmmSpec spec;
            const auto name = it->first.as<std::string>();
            const YAML::Node g = it->second;
            if (g.IsScalar())
                spec.model = g.as<std::string>();
            else
            {
                if (auto n = g["model"])
                    spec.model = n.as<std::string>();
                if (auto K = g["params"])
                    for (auto kv = K.begin(); kv != K.end(); ++kv)
                        spec.params.emplace(kv->first.as<std::string>(),
                                            kv->second.as<std::string>());
            }
            if (spec.model.empty())
                throw hazard::ConfigError("gmm." + name + ": missing model key");
            cfg.gmms.emplace(name, std::move(spec));
        }
    }

    if (auto P = root["plugins"])
    {
        for (const auto& item : P)
        {
            if (auto n = item["lib"])
                cfg.plugin_libs.push_back(n.as<std::string>());
        }
    }

    if (auto I = root["io"])
    {
        if (auto n = I["backend"])
            cfg.io.backend = parse_backend(n.as<std::string>());
        if (auto n = I["path"])
            cfg.io.path = n.as<std::string>();
        if (auto A = I["async"])
        {
            if (auto n = A["enabled"])
                cfg.io.async.enabled = n.as<bool>();
            if (auto n = A["max_queue"])
                cfg.io.async.max_queue = n.as<std::size_t>();
            if (A["drop_on_overflow"])
                throw hazard::ConfigError(
                    "io.async.drop_on_overflow is not supported: a full writer queue blocks "
                    "until the sink catches up");
        }
    }

    if (auto n = root["threads"])
        cfg.threads = n.as<int>();

    cfg.calc.validate();
    return cfg;
}

inline AppConfig load_config_from_yaml(const std::string& path)
{
    return load_config_from_node(YAML::LoadFile(path));
}
