#include <cmath>
#include <iomanip>
#include <iostream>
#include <vector>

#include "mesh/datasource.hpp"
#include "mesh/uniform.hpp"
#include "solver/homogenization.hpp"
#include "utils/config.hpp"
#include "utils/results.hpp"
#include "utils/scope_timer.hpp"

// Circular inclusion of radius 0.25 (permittivity 1) in a silicon-like
// matrix (permittivity 11.7), refined on nested structured meshes.
int main() {
    const double radius = 0.25;

    utils::settings settings;
    settings.inner_permittivity = 1.0;
    settings.outer_permittivity = 11.7;

    // Maxwell Garnett estimate for a dilute circular inclusion
    double fraction = M_PI * radius * radius;
    double ratio = (settings.inner_permittivity - settings.outer_permittivity)
                 / (settings.inner_permittivity + settings.outer_permittivity);
    double maxwell_garnett = settings.outer_permittivity * (1.0 + fraction * ratio) / (1.0 - fraction * ratio);

    std::cout << "Volume fraction of the inclusion: " << fraction << std::endl;
    std::cout << "Maxwell Garnett estimate: " << maxwell_garnett << std::endl;
    std::cout << std::endl;

    std::cout << std::setw(6) << "n" << std::setw(10) << "h" << std::setw(10) << "dofs"
              << std::setw(16) << "A00" << std::setw(16) << "A11"
              << std::setw(12) << "time [ms]" << std::endl;

    solver::HomogenizationResult finest;
    mesh::uniform generator;

    for (int n : {8, 16, 32, 64}) {
        mesh::unit_cell cell = generator.create_unit_cell(n, mesh::uniform::circular_inclusion(radius));

        utils::ScopeTimer timer("n = " + std::to_string(n), false);
        solver::HomogenizationResult result = solver::homogenization::run(cell, settings);

        std::cout << std::setw(6) << n << std::setw(10) << generator.get_diameter() << std::setw(10) << result.n_dofs
                  << std::setw(16) << std::setprecision(8) << result.tensor(0, 0)
                  << std::setw(16) << result.tensor(1, 1)
                  << std::setw(12) << std::setprecision(4) << timer.elapsed() << std::endl;

        if (n == 64) {
            mesh::datasource::exportUnitCellToJson(cell, "data/circular_inclusion_mesh.json");
            utils::results::exportCorrectorsToJson(cell, result, "data/circular_inclusion_correctors.json");
            finest = result;
        }
    }

    std::cout << std::endl << "Effective tensor on the finest mesh:" << std::endl;
    std::cout << utils::results::formatEffectiveTensor(finest.tensor);
    utils::results::writeEffectiveTensor(finest.tensor, "data/effective");

    return 0;
}
