/**
 * @file cell_problem.hpp
 * @brief Defines the periodic cell problem assembler and corrector solver
 */

#ifndef HOMCELL_SOLVER_CELL_PROBLEM_HPP
#define HOMCELL_SOLVER_CELL_PROBLEM_HPP

#include <array>
#include <iostream>
#include <string>
#include <vector>

#include <Eigen/Dense>
#include <Eigen/Sparse>

#include "material/permittivity.hpp"
#include "models/enums.hpp"
#include "models/templates.hpp"
#include "solver/function_space.hpp"
#include "utils/linear_solver.hpp"

namespace solver {
    /**
     * @class cell_problem
     * @brief P1 discretization of the periodic cell problem
     *
     * For each direction i the corrector f_i solves
     *
     *     sum_T k_T |T| grad f_i . grad v = - sum_T k_T |T| dv/dx_i   for all v,
     *
     * in the periodically constrained space. The stiffness matrix is the same
     * for both directions; it is assembled once and shared read-only. The
     * constant null space is removed by pinning the reference DOF to zero,
     * and each corrector is shifted to zero mean after the solve.
     */
    class cell_problem {
        public:
            /**
             * @brief Constructor. Computes the geometry of every element.
             *
             * @param space Periodic P1 space (its mesh must outlive the problem)
             * @param coefficient Cell-wise permittivity
             * @param debug_mode Print assembly and solve information
             * @throws AssemblyError if a cell has zero or non-finite area
             */
            cell_problem(
                const function_space& space,
                const material::permittivity& coefficient,
                bool debug_mode = false
            );

            /**
             * @brief Assemble the global stiffness matrix and its pinned variant
             */
            void assemble_system();

            bool is_assembled() const { return assembled_; }

            // Get global matrices
            const Eigen::SparseMatrix<double>& get_global_stiffness_matrix() const { return K_h; }
            const Eigen::SparseMatrix<double>& get_pinned_stiffness_matrix() const { return K_pinned; }

            /**
             * @brief Load vector L_i(v) = - sum_T k_T |T| dv/dx_i (reference DOF not zeroed)
             *
             * @param direction 0 for x, 1 for y
             */
            Eigen::VectorXd assemble_load_vector(int direction) const;

            /**
             * @brief Solve the corrector of one direction
             *
             * @param direction 0 for x, 1 for y
             * @param solver Linear solver to use (records its own statistics)
             * @return Zero-mean corrector DOF values
             * @throws SingularSystemError if the solve fails
             */
            Eigen::VectorXd solve_corrector(int direction, utils::linear_solver& solver) const;

            /**
             * @brief Solve both correctors, optionally on two threads
             *
             * @param solvers One configured solver per direction
             * @param parallel Run the two independent solves concurrently
             */
            std::array<Eigen::VectorXd, 2> solve_correctors(
                std::array<utils::linear_solver, 2>& solvers,
                bool parallel
            ) const;

            // integral of a P1 field over the unit cell
            double integrate(const Eigen::VectorXd& dof_values) const;

            // gradient of a P1 field on one element
            Eigen::Vector2d element_gradient(int element, const Eigen::VectorXd& dof_values) const;

            const ElementData& get_element_data(int element) const;

            int get_n_dofs() const { return space_.n_dofs(); }
            int get_n_elements() const { return static_cast<int>(element_data_.size()); }
            int get_reference_dof() const { return reference_dof_; }

            const function_space& get_function_space() const { return space_; }
            const material::permittivity& get_coefficient() const { return coefficient_; }

        private:
            const function_space& space_;
            const material::permittivity& coefficient_;

            std::vector<ElementData> element_data_;

            Eigen::SparseMatrix<double> K_h; // Stiffness matrix
            Eigen::SparseMatrix<double> K_pinned; // Stiffness matrix with the reference DOF pinned

            int reference_dof_ = 0;
            bool assembled_ = false;
            bool debug_mode_ = false;

            void setup_element(int element, ElementData& element_data);
            void debug_print(const std::string& message) const;
    };
}

#endif
