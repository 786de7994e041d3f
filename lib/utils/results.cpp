#include "utils/results.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

namespace {
    void createParentDirectory(const std::string& filename){
        std::filesystem::path dir = std::filesystem::path(filename).parent_path();
        if (!dir.empty()) {
            std::filesystem::create_directories(dir);
        }
    }

    std::string toString(double value){
        std::ostringstream stream;
        stream << std::setprecision(12) << value;
        return stream.str();
    }
}

std::string utils::results::formatEffectiveTensor(const Eigen::Matrix2d& tensor){
    std::string text;
    char line[64];
    for (int i = 0; i < 2; ++i) {
        std::snprintf(line, sizeof(line), "%12.6e %12.6e \n", tensor(i, 0), tensor(i, 1));
        text += line;
    }
    return text;
}

void utils::results::writeEffectiveTensor(const Eigen::Matrix2d& tensor, const std::string& filename){
    createParentDirectory(filename);

    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + filename);
    }
    file << formatEffectiveTensor(tensor);
}

void utils::results::exportCorrectorsToJson(
    const mesh::unit_cell& cell,
    const solver::HomogenizationResult& result,
    const std::string& filename
){
    using json = nlohmann::json;
    json j;

    j["metadata"]["nodeCount"] = cell.n_nodes();
    j["metadata"]["elementCount"] = cell.n_cells();
    j["metadata"]["dofCount"] = result.n_dofs;

    json jsonNodes = json::array();
    for (int i = 0; i < cell.n_nodes(); i++) {
        jsonNodes.push_back({cell.nodes()(i, 0), cell.nodes()(i, 1)});
    }
    j["nodes"] = jsonNodes;

    json jsonElements = json::array();
    for (int i = 0; i < cell.n_cells(); i++) {
        jsonElements.push_back({cell.elements()(i, 0), cell.elements()(i, 1), cell.elements()(i, 2)});
    }
    j["elements"] = jsonElements;

    j["subdomains"] = std::vector<int>(cell.subdomains().data(), cell.subdomains().data() + cell.subdomains().size());

    for (int i = 0; i < 2; ++i) {
        const Eigen::VectorXd& values = result.vertex_correctors[i];
        j["correctors"][i == 0 ? "x" : "y"] = std::vector<double>(values.data(), values.data() + values.size());
    }

    j["effective_tensor"] = {
        {result.tensor(0, 0), result.tensor(0, 1)},
        {result.tensor(1, 0), result.tensor(1, 1)}
    };

    createParentDirectory(filename);

    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + filename);
    }
    file << std::setw(4) << j << std::endl;
}

std::map<std::string, std::string> utils::results::buildRunRecord(
    const settings& run_settings,
    const solver::HomogenizationResult& result
){
    std::map<std::string, std::string> record;

    record["mesh_file"] = run_settings.mesh_file;
    record["inner_permittivity"] = toString(run_settings.inner_permittivity);
    record["outer_permittivity"] = toString(run_settings.outer_permittivity);
    record["solver"] = run_settings.solver_type == LinearSolverType::Direct ? "direct" : "iterative";

    record["vertices"] = std::to_string(result.n_vertices);
    record["cells"] = std::to_string(result.n_cells);
    record["dofs"] = std::to_string(result.n_dofs);
    record["slaves"] = std::to_string(result.n_slaves);

    record["A00"] = toString(result.tensor(0, 0));
    record["A01"] = toString(result.tensor(0, 1));
    record["A10"] = toString(result.tensor(1, 0));
    record["A11"] = toString(result.tensor(1, 1));

    record["iterations_x"] = std::to_string(result.statistics[0].iterations);
    record["iterations_y"] = std::to_string(result.statistics[1].iterations);
    record["residual_x"] = toString(result.statistics[0].relative_residual);
    record["residual_y"] = toString(result.statistics[1].relative_residual);

    return record;
}
