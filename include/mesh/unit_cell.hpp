/**
 * @file unit_cell.hpp
 * @brief Defines the read-only triangulated unit cell with subdomain tags
 */

#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef HOMCELL_MESH_UNIT_CELL_HPP
#define HOMCELL_MESH_UNIT_CELL_HPP

#include <vector>

#include <Eigen/Dense>

#include "models/exceptions.hpp"

namespace mesh {
    /**
     * @class unit_cell
     * @brief Triangle mesh of [0,1]x[0,1] with one subdomain tag per cell
     *
     * Tag 1 marks the inclusion, tag 2 the surrounding matrix. The mesh is
     * validated on construction and cannot be modified afterwards.
     */
    class unit_cell {
        public:
            /**
             * @brief Constructor
             *
             * @param nodes_coordinates N x 2 matrix of vertex coordinates
             * @param elements_indices M x 3 matrix of triangle vertex indices (0-based)
             * @param subdomain_tags M tags, each 1 (inclusion) or 2 (matrix)
             * @throws MeshLoadError if the data is inconsistent
             */
            unit_cell(
                Eigen::MatrixXd nodes_coordinates,
                Eigen::MatrixXi elements_indices,
                Eigen::VectorXi subdomain_tags
            );

            const Eigen::MatrixXd& nodes() const { return nodes_; }
            const Eigen::MatrixXi& elements() const { return elements_; }
            const Eigen::VectorXi& subdomains() const { return subdomains_; }

            int n_nodes() const { return static_cast<int>(nodes_.rows()); }
            int n_cells() const { return static_cast<int>(elements_.rows()); }

            // subdomain tag of a cell
            int tag(int cell) const;

            // coordinates of the three vertices of a cell
            Eigen::Matrix<double, 3, 2> cell_vertices(int cell) const;

            /**
             * @brief Flags of vertices lying on the mesh boundary
             *
             * A vertex is on the boundary iff it belongs to an edge shared by
             * exactly one cell.
             */
            const std::vector<bool>& boundary_nodes() const { return boundary_nodes_; }

            // total area covered by the cells
            double volume() const;

        private:
            Eigen::MatrixXd nodes_;
            Eigen::MatrixXi elements_;
            Eigen::VectorXi subdomains_;
            std::vector<bool> boundary_nodes_;

            void validate() const;
            void find_boundary_nodes();
    };
}

#endif
