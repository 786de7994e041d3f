#include <iostream>
#include <iomanip>
#include <map>
#include <string>

#include <Eigen/Dense>

#include "mesh/datasource.hpp"
#include "models/exceptions.hpp"
#include "solver/homogenization.hpp"
#include "utils/config.hpp"
#include "utils/logging.hpp"
#include "utils/results.hpp"

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(50, '=') << std::endl;
    std::cout << title << std::endl;
    std::cout << std::string(50, '=') << std::endl;
}

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "usage: " << argv[0] << " <config.json>" << std::endl;
        return 1;
    }

    try {
        utils::settings settings = utils::config::readJson(argv[1]);
        mesh::unit_cell cell = mesh::datasource::load(settings);

        print_separator("Unit cell");
        std::cout << "Mesh:     " << settings.mesh_file << std::endl;
        std::cout << "Vertices: " << cell.n_nodes() << std::endl;
        std::cout << "Cells:    " << cell.n_cells() << std::endl;
        std::cout << "Inner permittivity: " << settings.inner_permittivity << std::endl;
        std::cout << "Outer permittivity: " << settings.outer_permittivity << std::endl;

        solver::HomogenizationResult result = solver::homogenization::run(cell, settings);

        print_separator("Effective permittivity");
        std::cout << "DOFs: " << result.n_dofs << " (" << result.n_slaves << " periodic slaves)" << std::endl;
        for (int i = 0; i < 2; ++i) {
            std::cout << "Direction " << i << ": " << result.statistics[i].iterations << " iterations, residual "
                      << std::scientific << std::setprecision(3) << result.statistics[i].relative_residual
                      << std::defaultfloat << std::endl;
        }
        std::cout << utils::results::formatEffectiveTensor(result.tensor);

        if (!settings.effective_file.empty()) {
            utils::results::writeEffectiveTensor(result.tensor, settings.effective_file);
            std::cout << "Tensor written to " << settings.effective_file << std::endl;
        }

        if (!settings.corrector_file.empty()) {
            utils::results::exportCorrectorsToJson(cell, result, settings.corrector_file);
            std::cout << "Correctors written to " << settings.corrector_file << std::endl;
        }

        if (!settings.log_directory.empty()) {
            utils::logging log;
            std::map<std::string, std::string> record = utils::results::buildRunRecord(settings, result);
            log.buildLogFile(record, settings.log_directory);
        }
    } catch (const homcell_error& e) {
        std::cerr << "Error [" << e.stage() << "]: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error [output]: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
