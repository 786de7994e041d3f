#include "mesh/unit_cell.hpp"

#include <cmath>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "utils/operations.hpp"

namespace mesh {
    unit_cell::unit_cell(
        Eigen::MatrixXd nodes_coordinates,
        Eigen::MatrixXi elements_indices,
        Eigen::VectorXi subdomain_tags
    ) : nodes_(std::move(nodes_coordinates)),
        elements_(std::move(elements_indices)),
        subdomains_(std::move(subdomain_tags)) {

        validate();
        find_boundary_nodes();
    }

    int unit_cell::tag(int cell) const {
        if (cell < 0 || cell >= n_cells()) {
            throw std::out_of_range("Cell index " + std::to_string(cell) + " out of range");
        }
        return subdomains_(cell);
    }

    Eigen::Matrix<double, 3, 2> unit_cell::cell_vertices(int cell) const {
        if (cell < 0 || cell >= n_cells()) {
            throw std::out_of_range("Cell index " + std::to_string(cell) + " out of range");
        }

        Eigen::Matrix<double, 3, 2> coords;
        for (int i = 0; i < 3; ++i) {
            coords.row(i) = nodes_.row(elements_(cell, i));
        }
        return coords;
    }

    double unit_cell::volume() const {
        double total = 0.0;
        for (int e = 0; e < n_cells(); ++e) {
            Eigen::Matrix<double, 3, 2> v = cell_vertices(e);
            total += utils::operations::compute_triangle_area(
                v.row(0).transpose(), v.row(1).transpose(), v.row(2).transpose());
        }
        return total;
    }

    void unit_cell::validate() const {
        if (nodes_.rows() == 0 || nodes_.cols() != 2) {
            throw MeshLoadError("Mesh needs at least one vertex with 2 coordinates, got "
                + std::to_string(nodes_.rows()) + "x" + std::to_string(nodes_.cols()));
        }
        if (elements_.rows() == 0 || elements_.cols() != 3) {
            throw MeshLoadError("Mesh needs at least one triangle with 3 vertex indices, got "
                + std::to_string(elements_.rows()) + "x" + std::to_string(elements_.cols()));
        }
        if (subdomains_.size() != elements_.rows()) {
            throw MeshLoadError("Subdomain tag count (" + std::to_string(subdomains_.size())
                + ") does not match cell count (" + std::to_string(elements_.rows()) + ")");
        }

        for (int i = 0; i < nodes_.rows(); ++i) {
            if (!std::isfinite(nodes_(i, 0)) || !std::isfinite(nodes_(i, 1))) {
                throw MeshLoadError("Vertex " + std::to_string(i) + " has a non-finite coordinate");
            }
        }

        const int n = static_cast<int>(nodes_.rows());
        for (int e = 0; e < elements_.rows(); ++e) {
            for (int i = 0; i < 3; ++i) {
                int v = elements_(e, i);
                if (v < 0 || v >= n) {
                    throw MeshLoadError("Cell " + std::to_string(e) + " references vertex "
                        + std::to_string(v) + " out of range [0, " + std::to_string(n) + ")");
                }
            }
            if (elements_(e, 0) == elements_(e, 1) || elements_(e, 1) == elements_(e, 2)
                || elements_(e, 0) == elements_(e, 2)) {
                throw MeshLoadError("Cell " + std::to_string(e) + " repeats a vertex");
            }

            int t = subdomains_(e);
            if (t != 1 && t != 2) {
                throw MeshLoadError("Cell " + std::to_string(e) + " has subdomain tag "
                    + std::to_string(t) + ", expected 1 or 2");
            }
        }

        // every vertex must belong to a cell, otherwise its DOF has an empty row
        std::vector<bool> referenced(n, false);
        for (int e = 0; e < elements_.rows(); ++e) {
            for (int i = 0; i < 3; ++i) {
                referenced[elements_(e, i)] = true;
            }
        }
        for (int i = 0; i < n; ++i) {
            if (!referenced[i]) {
                throw MeshLoadError("Vertex " + std::to_string(i) + " is not used by any cell");
            }
        }
    }

    void unit_cell::find_boundary_nodes() {
        // count the cells adjacent to every edge
        std::map<std::pair<int, int>, int> edge_count;

        for (int e = 0; e < elements_.rows(); ++e) {
            for (int i = 0; i < 3; ++i) {
                int v1 = elements_(e, i);
                int v2 = elements_(e, (i + 1) % 3);

                // Ensure consistent ordering of edge
                std::pair<int, int> edge = (v1 < v2) ? std::make_pair(v1, v2) : std::make_pair(v2, v1);
                edge_count[edge]++;
            }
        }

        boundary_nodes_.assign(nodes_.rows(), false);
        for (const auto& entry : edge_count) {
            if (entry.second == 1) {
                boundary_nodes_[entry.first.first] = true;
                boundary_nodes_[entry.first.second] = true;
            }
        }
    }
}
