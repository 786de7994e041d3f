/**
 * @file homogenization.hpp
 * @brief Effective permittivity integration and the homogenization pipeline
 */

#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef HOMCELL_SOLVER_HOMOGENIZATION_HPP
#define HOMCELL_SOLVER_HOMOGENIZATION_HPP

#include <array>

#include <Eigen/Dense>

#include "mesh/unit_cell.hpp"
#include "solver/cell_problem.hpp"
#include "utils/config.hpp"
#include "utils/linear_solver.hpp"

namespace solver {
    /**
     * @brief Outcome of one homogenization run
     */
    struct HomogenizationResult {
        Eigen::Matrix2d tensor = Eigen::Matrix2d::Zero();

        // zero-mean correctors, DOF-indexed and expanded to the mesh vertices
        std::array<Eigen::VectorXd, 2> correctors;
        std::array<Eigen::VectorXd, 2> vertex_correctors;

        std::array<utils::linear_solver::Statistics, 2> statistics;

        int n_dofs = 0;
        int n_slaves = 0;
        int n_cells = 0;
        int n_vertices = 0;
    };

    class homogenization {
        public:
            /**
             * @brief Integrate the correctors into the effective tensor
             *
             * A_ii = sum_T k_T |T| (df_i/dx_i + 1). The off-diagonal entries
             * are not computed and stay exactly 0.
             *
             * @param problem Assembled cell problem the correctors were solved on
             * @param correctors DOF values of f_0 and f_1
             */
            static Eigen::Matrix2d compute_effective_tensor(
                const cell_problem& problem,
                const std::array<Eigen::VectorXd, 2>& correctors
            );

            // sum_T k_T |T| (df/dx_direction + 1)
            static double integrate_flux(
                const cell_problem& problem,
                const Eigen::VectorXd& corrector,
                int direction
            );

            /**
             * @brief Run the full pipeline on a unit cell
             *
             * Builds the periodic space and the coefficient, assembles the
             * stiffness matrix once, solves both correctors and integrates
             * the tensor. Nothing is written to disk.
             *
             * @throws MeshLoadError, AssemblyError, SingularSystemError, ConfigurationError
             */
            static HomogenizationResult run(const mesh::unit_cell& cell, const utils::settings& settings);
    };
}

#endif
