#include "solver/homogenization.hpp"

#include <cmath>
#include <iostream>
#include <memory>
#include <sstream>

#include "material/permittivity.hpp"
#include "models/exceptions.hpp"
#include "solver/function_space.hpp"
#include "solver/periodic_boundary.hpp"
#include "utils/scope_timer.hpp"

namespace solver {

    double homogenization::integrate_flux(
        const cell_problem& problem,
        const Eigen::VectorXd& corrector,
        int direction
    ){
        if (direction < 0 || direction > 1) {
            throw std::invalid_argument("Direction must be 0 or 1, got " + std::to_string(direction));
        }
        if (corrector.size() != problem.get_n_dofs()) {
            throw std::invalid_argument("Corrector has " + std::to_string(corrector.size())
                + " values, space has " + std::to_string(problem.get_n_dofs()) + " DOFs");
        }

        double flux = 0.0;
        for (int e = 0; e < problem.get_n_elements(); ++e) {
            const ElementData& element_data = problem.get_element_data(e);
            Eigen::Vector2d grad = problem.element_gradient(e, corrector);

            // integrand is constant on the cell
            flux += element_data.permittivity * element_data.area * (grad(direction) + 1.0);
        }

        if (!std::isfinite(flux)) {
            throw AssemblyError("Non-finite flux integral in direction " + std::to_string(direction));
        }

        return flux;
    }

    Eigen::Matrix2d homogenization::compute_effective_tensor(
        const cell_problem& problem,
        const std::array<Eigen::VectorXd, 2>& correctors
    ){
        Eigen::Matrix2d tensor = Eigen::Matrix2d::Zero();
        tensor(0, 0) = integrate_flux(problem, correctors[0], 0);
        tensor(1, 1) = integrate_flux(problem, correctors[1], 1);
        return tensor;
    }

    HomogenizationResult homogenization::run(const mesh::unit_cell& cell, const utils::settings& settings){
        utils::config::validate(settings);

        utils::ScopeTimer total_timer("Homogenization", settings.debug);

        periodic_boundary boundary(settings.periodic_tolerance);
        material::permittivity coefficient(settings.inner_permittivity, settings.outer_permittivity, cell.subdomains());

        std::unique_ptr<function_space> space;
        {
            utils::ScopeTimer timer("Function space", settings.debug);
            space = std::make_unique<function_space>(cell, boundary, settings.debug);
        }

        std::unique_ptr<cell_problem> problem;
        {
            utils::ScopeTimer timer("Assembly", settings.debug);
            problem = std::make_unique<cell_problem>(*space, coefficient, settings.debug);
            problem->assemble_system();
        }

        std::array<utils::linear_solver, 2> solvers = {
            utils::linear_solver(settings.solver_type, settings.tolerance, settings.max_iterations),
            utils::linear_solver(settings.solver_type, settings.tolerance, settings.max_iterations)
        };
        for (utils::linear_solver& solver : solvers) {
            solver.set_debug_mode(settings.debug);
        }

        HomogenizationResult result;
        {
            utils::ScopeTimer timer("Corrector solves", settings.debug);
            result.correctors = problem->solve_correctors(solvers, settings.parallel_directions);
        }

        result.tensor = compute_effective_tensor(*problem, result.correctors);

        for (int i = 0; i < 2; ++i) {
            result.vertex_correctors[i] = space->to_vertex_values(result.correctors[i]);
            result.statistics[i] = solvers[i].get_statistics();
        }

        result.n_dofs = space->n_dofs();
        result.n_slaves = space->n_slaves();
        result.n_cells = cell.n_cells();
        result.n_vertices = cell.n_nodes();

        if (settings.debug) {
            std::cout << "[DEBUG] Homogenization: effective tensor" << std::endl;
            std::cout << result.tensor << std::endl;
        }

        return result;
    }
}
