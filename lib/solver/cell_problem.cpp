#include "solver/cell_problem.hpp"

#include <future>
#include <sstream>

#include "models/exceptions.hpp"
#include "utils/operations.hpp"

namespace solver {

    cell_problem::cell_problem(
        const function_space& space,
        const material::permittivity& coefficient,
        bool debug_mode
    ) : space_(space), coefficient_(coefficient), debug_mode_(debug_mode) {

        const mesh::unit_cell& cell = space_.get_unit_cell();

        if (coefficient_.n_cells() != cell.n_cells()) {
            throw std::invalid_argument("Permittivity covers " + std::to_string(coefficient_.n_cells())
                + " cells, mesh has " + std::to_string(cell.n_cells()));
        }

        element_data_.resize(cell.n_cells());
        for (int e = 0; e < cell.n_cells(); ++e) {
            setup_element(e, element_data_[e]);
        }
    }

    // ============================================================================
    // ASSEMBLY
    // ============================================================================

    void cell_problem::setup_element(int element, ElementData& element_data){
        const mesh::unit_cell& cell = space_.get_unit_cell();

        if (!utils::operations::setup_triangle(cell.cell_vertices(element), element_data)) {
            std::ostringstream msg;
            msg << "Cell " << element << " is degenerate (zero or non-finite area), vertices "
                << cell.elements()(element, 0) << ", " << cell.elements()(element, 1) << ", "
                << cell.elements()(element, 2);
            throw AssemblyError(msg.str());
        }

        element_data.permittivity = coefficient_.value(element);
        element_data.dofs = space_.element_dofs(element);

        // K_T = k_T |T| G G^T
        element_data.K_local = element_data.permittivity * element_data.area
                             * element_data.gradients * element_data.gradients.transpose();
    }

    void cell_problem::assemble_system(){
        const int n_dofs = space_.n_dofs();

        std::vector<Eigen::Triplet<double>> triplets;
        std::vector<Eigen::Triplet<double>> pinned_triplets;
        triplets.reserve(9 * element_data_.size());
        pinned_triplets.reserve(9 * element_data_.size() + 1);

        for (const ElementData& element_data : element_data_) {
            for (int i = 0; i < 3; ++i) {
                for (int j = 0; j < 3; ++j) {
                    int global_i = element_data.dofs[i];
                    int global_j = element_data.dofs[j];

                    // slave rows/columns land on their master DOF and are summed
                    triplets.emplace_back(global_i, global_j, element_data.K_local(i, j));

                    if (global_i != reference_dof_ && global_j != reference_dof_) {
                        pinned_triplets.emplace_back(global_i, global_j, element_data.K_local(i, j));
                    }
                }
            }
        }
        pinned_triplets.emplace_back(reference_dof_, reference_dof_, 1.0);

        K_h.resize(n_dofs, n_dofs);
        K_h.setFromTriplets(triplets.begin(), triplets.end());

        K_pinned.resize(n_dofs, n_dofs);
        K_pinned.setFromTriplets(pinned_triplets.begin(), pinned_triplets.end());

        assembled_ = true;

        if (debug_mode_) {
            debug_print("Assembled " + std::to_string(element_data_.size()) + " elements into "
                + std::to_string(n_dofs) + " DOFs, " + std::to_string(K_h.nonZeros()) + " nonzeros");
        }
    }

    Eigen::VectorXd cell_problem::assemble_load_vector(int direction) const {
        if (direction != 0 && direction != 1) {
            throw std::invalid_argument("Direction must be 0 or 1, got " + std::to_string(direction));
        }

        Eigen::VectorXd F_h = Eigen::VectorXd::Zero(space_.n_dofs());

        for (const ElementData& element_data : element_data_) {
            for (int i = 0; i < 3; ++i) {
                F_h(element_data.dofs[i]) -= element_data.permittivity * element_data.area
                                           * element_data.gradients(i, direction);
            }
        }

        return F_h;
    }

    // ============================================================================
    // SOLVE
    // ============================================================================

    Eigen::VectorXd cell_problem::solve_corrector(int direction, utils::linear_solver& solver) const {
        if (!assembled_) {
            throw std::logic_error("assemble_system() must be called before solving");
        }

        Eigen::VectorXd b = assemble_load_vector(direction);
        b(reference_dof_) = 0.0;

        Eigen::VectorXd corrector = Eigen::VectorXd::Zero(b.size());
        solver.solve(K_pinned, b, corrector);

        // fix the free constant: zero mean over the cell
        double mean = integrate(corrector) / space_.get_unit_cell().volume();
        corrector.array() -= mean;

        if (debug_mode_) {
            debug_print("Corrector " + std::to_string(direction) + " solved, max |f| = "
                + std::to_string(corrector.cwiseAbs().maxCoeff()));
        }

        return corrector;
    }

    std::array<Eigen::VectorXd, 2> cell_problem::solve_correctors(
        std::array<utils::linear_solver, 2>& solvers,
        bool parallel
    ) const {
        std::array<Eigen::VectorXd, 2> correctors;

        if (parallel) {
            // the second direction runs on its own thread; get() rethrows its failure
            std::future<Eigen::VectorXd> second = std::async(std::launch::async, [this, &solvers]() {
                return solve_corrector(1, solvers[1]);
            });
            correctors[0] = solve_corrector(0, solvers[0]);
            correctors[1] = second.get();
        } else {
            correctors[0] = solve_corrector(0, solvers[0]);
            correctors[1] = solve_corrector(1, solvers[1]);
        }

        return correctors;
    }

    // ============================================================================
    // POST-PROCESSING HELPERS
    // ============================================================================

    double cell_problem::integrate(const Eigen::VectorXd& dof_values) const {
        double total = 0.0;
        for (const ElementData& element_data : element_data_) {
            double sum = dof_values(element_data.dofs[0]) + dof_values(element_data.dofs[1])
                       + dof_values(element_data.dofs[2]);
            total += element_data.area * sum / 3.0;
        }
        return total;
    }

    Eigen::Vector2d cell_problem::element_gradient(int element, const Eigen::VectorXd& dof_values) const {
        const ElementData& element_data = get_element_data(element);

        Eigen::Vector3d local;
        for (int i = 0; i < 3; ++i) {
            local(i) = dof_values(element_data.dofs[i]);
        }
        return element_data.gradients.transpose() * local;
    }

    const ElementData& cell_problem::get_element_data(int element) const {
        if (element < 0 || element >= static_cast<int>(element_data_.size())) {
            throw std::out_of_range("Element index out of range for ElementData access");
        }
        return element_data_[element];
    }

    void cell_problem::debug_print(const std::string& message) const {
        if (debug_mode_) {
            std::cout << "[DEBUG] Cell Problem: " << message << std::endl;
        }
    }
}
