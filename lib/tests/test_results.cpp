#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <string>

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

#include "mesh/uniform.hpp"
#include "solver/homogenization.hpp"
#include "utils/logging.hpp"
#include "utils/results.hpp"

namespace {
    std::filesystem::path scratch_directory(){
        std::filesystem::path dir = std::filesystem::temp_directory_path() / "homcell_results_tests";
        std::filesystem::create_directories(dir);
        return dir;
    }

    std::string read_text(const std::filesystem::path& path){
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }
}

TEST(ResultsTests, EffectiveFileFormat)
{
    Eigen::Matrix2d tensor;
    tensor << 2.5, 0.0,
              0.0, 4.0;

    std::filesystem::path path = scratch_directory() / "effective";
    utils::results::writeEffectiveTensor(tensor, path.string());

    EXPECT_EQ(read_text(path), "2.500000e+00 0.000000e+00 \n0.000000e+00 4.000000e+00 \n");
    EXPECT_EQ(utils::results::formatEffectiveTensor(tensor), read_text(path));
}

TEST(ResultsTests, EffectiveFileKeepsFieldWidth)
{
    Eigen::Matrix2d tensor;
    tensor << 6.0540914, 0.0,
              0.0, 6.0540914;

    std::string text = utils::results::formatEffectiveTensor(tensor);
    EXPECT_EQ(text, "6.054091e+00 0.000000e+00 \n0.000000e+00 6.054091e+00 \n");
}

TEST(ResultsTests, ExportsCorrectorsWithMesh)
{
    mesh::unit_cell cell = mesh::uniform().create_unit_cell(4, mesh::uniform::circular_inclusion(0.3));
    utils::settings settings;
    solver::HomogenizationResult result = solver::homogenization::run(cell, settings);

    std::filesystem::path path = scratch_directory() / "nested" / "correctors.json";
    utils::results::exportCorrectorsToJson(cell, result, path.string());

    std::ifstream file(path);
    nlohmann::json j;
    file >> j;

    EXPECT_EQ(j["nodes"].size(), 25u);
    EXPECT_EQ(j["elements"].size(), 32u);
    EXPECT_EQ(j["subdomains"].size(), 32u);
    EXPECT_EQ(j["correctors"]["x"].size(), 25u);
    EXPECT_EQ(j["correctors"]["y"].size(), 25u);
    EXPECT_EQ(j["metadata"]["dofCount"].get<int>(), 16);
    EXPECT_DOUBLE_EQ(j["effective_tensor"][0][0].get<double>(), result.tensor(0, 0));
    EXPECT_DOUBLE_EQ(j["effective_tensor"][1][1].get<double>(), result.tensor(1, 1));
    EXPECT_DOUBLE_EQ(j["effective_tensor"][0][1].get<double>(), 0.0);
    EXPECT_DOUBLE_EQ(j["correctors"]["x"][3].get<double>(), result.vertex_correctors[0](3));
}

TEST(ResultsTests, RunLogIsWritten)
{
    mesh::unit_cell cell = mesh::uniform().create_unit_cell(2, mesh::uniform::circular_inclusion(0.3));
    utils::settings settings;
    settings.mesh_file = "structured";
    solver::HomogenizationResult result = solver::homogenization::run(cell, settings);

    std::map<std::string, std::string> record = utils::results::buildRunRecord(settings, result);
    EXPECT_EQ(record["dofs"], "4");
    EXPECT_EQ(record["solver"], "direct");
    EXPECT_EQ(record["A01"], "0");

    utils::logging log;
    std::filesystem::path dir = scratch_directory() / "log";
    std::string filename = log.buildLogFile(record, dir.string());

    ASSERT_TRUE(std::filesystem::exists(filename));
    std::ifstream file(filename);
    nlohmann::json j;
    file >> j;
    EXPECT_EQ(j["mesh_file"], "structured");
    EXPECT_EQ(j["dofs"], "4");
    EXPECT_TRUE(j.contains("date"));
    EXPECT_TRUE(j.contains("timestamp"));
}
