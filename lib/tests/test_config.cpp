#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

#include "models/exceptions.hpp"
#include "utils/config.hpp"

using json = nlohmann::json;

TEST(ConfigTests, DefaultsMatchOriginalCase)
{
    utils::settings settings = utils::config::fromJson(json::object());

    EXPECT_DOUBLE_EQ(settings.inner_permittivity, 1.0);
    EXPECT_DOUBLE_EQ(settings.outer_permittivity, 11.7);
    EXPECT_EQ(settings.solver_type, LinearSolverType::Direct);
    EXPECT_DOUBLE_EQ(settings.tolerance, 1e-10);
    EXPECT_EQ(settings.max_iterations, 5000);
    EXPECT_DOUBLE_EQ(settings.periodic_tolerance, 1e-10);
    EXPECT_TRUE(settings.parallel_directions);
    EXPECT_EQ(settings.effective_file, "effective");
    EXPECT_TRUE(settings.corrector_file.empty());
    EXPECT_EQ(settings.mesh_group, "mesh");
    EXPECT_EQ(settings.subdomain_group, "subdomains");
    EXPECT_FALSE(settings.debug);
}

TEST(ConfigTests, ReadsValues)
{
    json j = {
        {"inner_permittivity", 2.0},
        {"outer_permittivity", 4.0},
        {"mesh_file", "cell.h5"},
        {"solver", "iterative"},
        {"tolerance", 1e-8},
        {"max_iterations", 200},
        {"parallel_directions", false},
        {"corrector_file", "out/correctors.json"},
        {"debug", true}
    };
    utils::settings settings = utils::config::fromJson(j);

    EXPECT_DOUBLE_EQ(settings.inner_permittivity, 2.0);
    EXPECT_DOUBLE_EQ(settings.outer_permittivity, 4.0);
    EXPECT_EQ(settings.mesh_format, MeshFormat::Hdf5);
    EXPECT_EQ(settings.solver_type, LinearSolverType::Iterative);
    EXPECT_DOUBLE_EQ(settings.tolerance, 1e-8);
    EXPECT_EQ(settings.max_iterations, 200);
    EXPECT_FALSE(settings.parallel_directions);
    EXPECT_EQ(settings.corrector_file, "out/correctors.json");
    EXPECT_TRUE(settings.debug);
}

TEST(ConfigTests, MeshFormatFromExtensionOrKey)
{
    EXPECT_EQ(utils::config::inferMeshFormat("cell.h5"), MeshFormat::Hdf5);
    EXPECT_EQ(utils::config::inferMeshFormat("data/cell.hdf5"), MeshFormat::Hdf5);
    EXPECT_EQ(utils::config::inferMeshFormat("cell.json"), MeshFormat::Json);
    EXPECT_EQ(utils::config::inferMeshFormat("cell"), MeshFormat::Json);

    json j = {{"mesh_file", "cell.dat"}, {"mesh_format", "hdf5"}};
    EXPECT_EQ(utils::config::fromJson(j).mesh_format, MeshFormat::Hdf5);
}

TEST(ConfigTests, InvalidValuesRaiseConfigurationError)
{
    EXPECT_THROW(utils::config::fromJson({{"solver", "multigrid"}}), ConfigurationError);
    EXPECT_THROW(utils::config::fromJson({{"mesh_format", "xdmf"}}), ConfigurationError);
    EXPECT_THROW(utils::config::fromJson({{"outer_permittivity", 0.0}}), ConfigurationError);
    EXPECT_THROW(utils::config::fromJson({{"inner_permittivity", -1.0}}), ConfigurationError);
    EXPECT_THROW(utils::config::fromJson({{"tolerance", -1e-3}}), ConfigurationError);
    EXPECT_THROW(utils::config::fromJson({{"max_iterations", 0}}), ConfigurationError);
    EXPECT_THROW(utils::config::fromJson({{"periodic_tolerance", 0.5}}), ConfigurationError);
    EXPECT_THROW(utils::config::fromJson({{"inner_permittivity", "one"}}), ConfigurationError);
    EXPECT_THROW(utils::config::fromJson(json::array()), ConfigurationError);
}

TEST(ConfigTests, ReadsFileAndResolvesMeshPath)
{
    std::filesystem::path dir = std::filesystem::temp_directory_path() / "homcell_config_tests";
    std::filesystem::create_directories(dir);
    std::filesystem::path path = dir / "run.json";
    {
        std::ofstream file(path);
        file << R"({"mesh_file": "cell.json", "outer_permittivity": 5.0})";
    }

    utils::settings settings = utils::config::readJson(path.string());
    EXPECT_EQ(settings.mesh_file, (dir / "cell.json").string());
    EXPECT_DOUBLE_EQ(settings.outer_permittivity, 5.0);

    // absolute mesh paths are kept as written
    std::filesystem::path absolute = dir / "meshes" / "cell.json";
    {
        std::ofstream file(dir / "absolute.json");
        file << json{{"mesh_file", absolute.string()}}.dump();
    }
    EXPECT_EQ(utils::config::readJson((dir / "absolute.json").string()).mesh_file, absolute.string());

    EXPECT_THROW(utils::config::readJson((dir / "missing.json").string()), ConfigurationError);

    {
        std::ofstream file(dir / "broken.json");
        file << "{\"solver\": ";
    }
    EXPECT_THROW(utils::config::readJson((dir / "broken.json").string()), ConfigurationError);
}
