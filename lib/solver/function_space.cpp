#include "solver/function_space.hpp"

#include <sstream>

#include "models/exceptions.hpp"
#include "utils/operations.hpp"

namespace solver {
    function_space::function_space(
        const mesh::unit_cell& cell,
        const periodic_boundary& boundary,
        bool debug_mode
    ) : cell_(cell), debug_mode_(debug_mode) {

        pair_boundary_vertices(boundary);
        number_dofs();

        if (debug_mode_) {
            debug_print("Vertices: " + std::to_string(cell_.n_nodes()));
            debug_print("Slave vertices: " + std::to_string(n_slaves_));
            debug_print("Independent DOFs: " + std::to_string(n_dofs_));
        }
    }

    std::array<int, 3> function_space::element_dofs(int cell) const {
        if (cell < 0 || cell >= cell_.n_cells()) {
            throw std::out_of_range("Cell index " + std::to_string(cell) + " out of range");
        }

        const Eigen::MatrixXi& elements = cell_.elements();
        return {
            vertex_to_dof_[elements(cell, 0)],
            vertex_to_dof_[elements(cell, 1)],
            vertex_to_dof_[elements(cell, 2)]
        };
    }

    Eigen::VectorXd function_space::to_vertex_values(const Eigen::VectorXd& dof_values) const {
        if (dof_values.size() != n_dofs_) {
            throw std::invalid_argument("Expected " + std::to_string(n_dofs_)
                + " DOF values, got " + std::to_string(dof_values.size()));
        }

        Eigen::VectorXd values(cell_.n_nodes());
        for (int v = 0; v < cell_.n_nodes(); ++v) {
            values(v) = dof_values(vertex_to_dof_[v]);
        }
        return values;
    }

    void function_space::pair_boundary_vertices(const periodic_boundary& boundary) {
        const Eigen::MatrixXd& nodes = cell_.nodes();
        const std::vector<bool>& on_boundary = cell_.boundary_nodes();
        const double tol = boundary.tolerance();
        const int n_nodes = cell_.n_nodes();

        master_vertex_.resize(n_nodes);
        n_slaves_ = 0;

        // candidate masters on the left and bottom edges
        std::vector<int> masters;
        for (int v = 0; v < n_nodes; ++v) {
            master_vertex_[v] = v;
            if (boundary.classify(nodes.row(v).transpose(), on_boundary[v])) {
                masters.push_back(v);
            }
        }

        for (int v = 0; v < n_nodes; ++v) {
            Eigen::Vector2d x = nodes.row(v).transpose();

            if (!on_boundary[v] || boundary.classify(x, true)) continue;

            Eigen::Vector2d y = boundary.map(x);
            if (!boundary.classify(y, true)) continue;

            int partner = -1;
            for (int m : masters) {
                if (utils::operations::near(nodes(m, 0), y(0), tol)
                    && utils::operations::near(nodes(m, 1), y(1), tol)) {
                    partner = m;
                    break;
                }
            }

            if (partner < 0) {
                std::ostringstream msg;
                msg << "Mesh is not periodic: vertex " << v << " at (" << x(0) << ", " << x(1)
                    << ") has no vertex at its image (" << y(0) << ", " << y(1) << ")";
                throw MeshLoadError(msg.str());
            }

            master_vertex_[v] = partner;
            n_slaves_++;
        }
    }

    void function_space::number_dofs() {
        const int n_nodes = cell_.n_nodes();
        vertex_to_dof_.assign(n_nodes, -1);

        int dof_counter = 0;
        for (int v = 0; v < n_nodes; ++v) {
            int representative = master_vertex_[v];
            if (vertex_to_dof_[representative] < 0) {
                vertex_to_dof_[representative] = dof_counter++;
            }
            vertex_to_dof_[v] = vertex_to_dof_[representative];
        }

        n_dofs_ = dof_counter;
    }

    void function_space::debug_print(const std::string& message) const {
        if (debug_mode_) {
            std::cout << "[DEBUG] Function Space: " << message << std::endl;
        }
    }
}
