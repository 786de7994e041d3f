/**
 * @file function_space.hpp
 * @brief Periodically constrained P1 function space on a unit cell
 */

#ifndef HOMCELL_SOLVER_FUNCTION_SPACE_HPP
#define HOMCELL_SOLVER_FUNCTION_SPACE_HPP

#include <array>
#include <iostream>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "mesh/unit_cell.hpp"
#include "solver/periodic_boundary.hpp"

namespace solver {
    /**
     * @class function_space
     * @brief Continuous piecewise-linear scalars with periodic DOF identification
     *
     * Every slave vertex on the right or top edge shares the DOF of the master
     * vertex found at its periodic image, so the space has fewer unknowns than
     * the mesh has vertices. The mesh must outlive the space.
     */
    class function_space {
        public:
            /**
             * @brief Build the DOF-reduction map
             *
             * @param cell Unit cell mesh
             * @param boundary Periodic master/slave predicates
             * @param debug_mode Print the reduction summary
             * @throws MeshLoadError if a slave vertex has no vertex at its periodic image
             */
            function_space(
                const mesh::unit_cell& cell,
                const periodic_boundary& boundary,
                bool debug_mode = false
            );

            // Number of independent unknowns
            int n_dofs() const { return n_dofs_; }

            // Number of vertices identified with another vertex
            int n_slaves() const { return n_slaves_; }

            const std::vector<int>& vertex_to_dof() const { return vertex_to_dof_; }

            /**
             * @brief Vertex whose DOF a vertex shares (itself unless it is a slave)
             */
            const std::vector<int>& master_vertex() const { return master_vertex_; }

            // Global DOFs of the three vertices of a cell
            std::array<int, 3> element_dofs(int cell) const;

            /**
             * @brief Expand DOF values to one value per mesh vertex
             */
            Eigen::VectorXd to_vertex_values(const Eigen::VectorXd& dof_values) const;

            const mesh::unit_cell& get_unit_cell() const { return cell_; }

        private:
            const mesh::unit_cell& cell_;
            std::vector<int> master_vertex_;
            std::vector<int> vertex_to_dof_;
            int n_dofs_ = 0;
            int n_slaves_ = 0;
            bool debug_mode_ = false;

            void pair_boundary_vertices(const periodic_boundary& boundary);
            void number_dofs();
            void debug_print(const std::string& message) const;
    };
}

#endif
