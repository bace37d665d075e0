#include <catch2/catch_all.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "master/io/ConfigYAML.hpp" // <-- same header main.cpp uses

namespace fs = std::filesystem;
using disagg::master::io::WriterConfig;

static std::string write_temp_yaml(const std::string& stem, const std::string& content)
{
    const auto tmp =
        fs::temp_directory_path() / (stem + "_" + std::to_string(std::rand()) + ".yml");
    std::ofstream out(tmp);
    out << content;
    out.close();
    return tmp.string();
}

TEST_CASE("ConfigYAML parses a full disaggregation job", "[config][yaml]")
{
    // NOTE: proper indentation matters in YAML.
    const char* YAML_TXT = R"YAML(
#=======================
# disagg config (v1)
#=======================
case: nz_disagg

input:
  store: model.h5

calculation:
  investigation_time: 50.0
  truncation_level: 3.0
  maximum_distance: {default: 200, "Subduction Interface": 300}
  mag_bin_width: 0.25
  distance_bin_width: 20
  coordinate_bin_width: 0.5
  num_epsilon_bins: 4
  disagg_bin_edges:
    mag: [5.0, 6.0, 7.0, 8.0]
  imtls:
    SA(1.0): [0.01, 0.1, 0.5]
    PGA: [0.01, 0.1, 0.5, 1.0]
  poes_disagg: [0.1, 0.02]
  rlz_index: 3
  max_sites_disagg: 4
  disagg_outputs: [Mag, Mag_Dist]
  disagg_by_src: true
  concurrent_tasks: 32
  max_data_transfer: 1.0e+9

gmm:
  BooreAtkinson2008:
    model: generic_attenuation
    params: {c0: "-0.5", "sigma@PGA": "0.7"}
  Simple: generic_attenuation

plugins:
  - lib: libgmm_builtin.so

io:
  backend: HDF5
  path: out
  async:
    enabled: true
    max_queue: 8

threads: 2
)YAML";

    const std::string path = write_temp_yaml("full_job", YAML_TXT);
    const AppConfig cfg = load_config_from_yaml(path);
    const auto& c = cfg.calc;

    CAPTURE(cfg.case_name, cfg.store_path, cfg.plugin_libs.size(), cfg.threads);

    CHECK(cfg.case_name == "nz_disagg");
    CHECK(cfg.store_path == "model.h5");

    CHECK(c.investigation_time == Catch::Approx(50.0));
    CHECK(c.maximum_distance("Active Shallow Crust") == Catch::Approx(200.0));
    CHECK(c.maximum_distance("Subduction Interface") == Catch::Approx(300.0));
    CHECK(c.mag_bin_width == Catch::Approx(0.25));
    CHECK(c.num_epsilon_bins == 4);
    REQUIRE(c.mag_edges.has_value());
    CHECK(c.mag_edges->size() == 4);
    CHECK_FALSE(c.dist_edges.has_value());

    // document order is kept
    REQUIRE(c.imtls.size() == 2);
    CHECK(c.imtls.name(0) == "SA(1.0)");
    CHECK(c.imtls.name(1) == "PGA");
    CHECK(c.imtls.levels(1).size() == 4);

    CHECK(c.poes_disagg == std::vector<double>({0.1, 0.02}));
    REQUIRE(c.rlz_index.has_value());
    CHECK(*c.rlz_index == std::vector<int>({3}));
    CHECK(c.max_sites_disagg == 4);
    CHECK(c.disagg_outputs == std::vector<std::string>({"Mag", "Mag_Dist"}));
    CHECK(c.disagg_by_src);
    CHECK(c.concurrent_tasks == 32);
    CHECK(c.max_data_transfer == Catch::Approx(1.0e9));

    REQUIRE(cfg.gmms.size() == 2);
    const auto& ba = cfg.gmms.at("BooreAtkinson2008");
    CHECK(ba.model == "generic_attenuation");
    CHECK(ba.params.at("c0") == "-0.5");
    CHECK(ba.params.at("sigma@PGA") == "0.7");
    CHECK(cfg.gmms.at("Simple").model == "generic_attenuation");
    CHECK(cfg.gmms.at("Simple").params.empty());

    REQUIRE(cfg.plugin_libs.size() == 1);
    CHECK(cfg.plugin_libs[0] == std::string("libgmm_builtin.so"));

    CHECK(cfg.io.backend == WriterConfig::Backend::Hdf5);
    CHECK(cfg.io.path == std::string("out"));
    CHECK(cfg.io.async.enabled == true);
    CHECK(cfg.io.async.max_queue == 8);
    CHECK(cfg.threads == 2);
}

TEST_CASE("ConfigYAML keeps defaults for missing keys", "[config][yaml]")
{
    const char* YAML_TXT = R"YAML(
input: { store: m.h5 }
calculation:
  imtls: { PGA: [0.1, 0.2] }
  iml_disagg: { PGA: 0.15 }
io: { backend: null, path: out }
)YAML";
    const AppConfig cfg = load_config_from_yaml(write_temp_yaml("defaults", YAML_TXT));
    CHECK(cfg.case_name == "disagg");
    CHECK(cfg.calc.truncation_level == Catch::Approx(3.0));
    CHECK(cfg.calc.maximum_distance("any") == Catch::Approx(200.0));
    CHECK(cfg.calc.num_rlzs_disagg == 1);
    CHECK_FALSE(cfg.calc.rlz_index.has_value());
    REQUIRE(cfg.calc.fixed_iml("PGA").has_value());
    CHECK(*cfg.calc.fixed_iml("PGA") == Catch::Approx(0.15));
    CHECK(cfg.io.backend == WriterConfig::Backend::Null);
    CHECK(cfg.gmms.empty());
}

TEST_CASE("ConfigYAML rejects inconsistent jobs", "[config][yaml]")
{
    SECTION("poes and imls together")
    {
        const char* y = R"YAML(
calculation:
  imtls: { PGA: [0.1, 0.2] }
  poes_disagg: [0.1]
  iml_disagg: { PGA: 0.15 }
)YAML";
        REQUIRE_THROWS_AS(load_config_from_node(YAML::Load(y)), hazard::ConfigError);
    }
    SECTION("non-positive truncation level")
    {
        const char* y = R"YAML(
calculation:
  truncation_level: 0
  imtls: { PGA: [0.1, 0.2] }
  poes_disagg: [0.1]
)YAML";
        REQUIRE_THROWS_AS(load_config_from_node(YAML::Load(y)), hazard::ConfigError);
    }
    SECTION("unknown output")
    {
        const char* y = R"YAML(
calculation:
  imtls: { PGA: [0.1, 0.2] }
  poes_disagg: [0.1]
  disagg_outputs: [Mag_Depth]
)YAML";
        REQUIRE_THROWS_AS(load_config_from_node(YAML::Load(y)), hazard::ConfigError);
    }
    SECTION("unknown backend")
    {
        const char* y = R"YAML(
calculation:
  imtls: { PGA: [0.1, 0.2] }
  poes_disagg: [0.1]
io: { backend: cgns }
)YAML";
        REQUIRE_THROWS_AS(load_config_from_node(YAML::Load(y)), hazard::ConfigError);
    }
    SECTION("gmm without a model")
    {
        const char* y = R"YAML(
calculation:
  imtls: { PGA: [0.1, 0.2] }
  poes_disagg: [0.1]
gmm:
  Foo: { params: { c0: "1" } }
)YAML";
        REQUIRE_THROWS_AS(load_config_from_node(YAML::Load(y)), hazard::ConfigError);
    }
    SECTION("dropping writes on a full async queue")
    {
        const char* y = R"YAML(
calculation:
  imtls: { PGA: [0.1, 0.2] }
  poes_disagg: [0.1]
io:
  async: { enabled: true, max_queue: 1, drop_on_overflow: true }
)YAML";
        REQUIRE_THROWS_WITH(load_config_from_node(YAML::Load(y)),
                            Catch::Matchers::ContainsSubstring("drop_on_overflow"));
    }
}
