#include "mesh/uniform.hpp"

#include <stdexcept>

#include "utils/operations.hpp"

namespace mesh {
    void uniform::create_square_nxn_mesh(
        Eigen::MatrixXd& nodes, 
        Eigen::MatrixXi& elements, 
        int n
    ){
        if (n < 1) {
            throw std::invalid_argument("Mesh needs at least one square per direction");
        }

        // Number of nodes in each direction
        int nodes_per_direction = n + 1;
        int total_nodes = nodes_per_direction * nodes_per_direction;
        int total_elements = 2 * n * n;
        
        // Element size
        double h = 1.0 / static_cast<double>(n);
        
        // Resize matrices
        nodes.resize(total_nodes, 2);
        elements.resize(total_elements, 3);
        
        // Generate nodes
        int node_idx = 0;
        for (int j = 0; j < nodes_per_direction; ++j) {      // y direction (rows)
            for (int i = 0; i < nodes_per_direction; ++i) {  // x direction (cols)
                // last row/column set exactly so that periodic images coincide
                nodes(node_idx, 0) = (i == n) ? 1.0 : i * h;  // x coordinate
                nodes(node_idx, 1) = (j == n) ? 1.0 : j * h;  // y coordinate
                node_idx++;
            }
        }
        
        // Generate elements
        int elem_idx = 0;
        for (int j = 0; j < n; ++j) {      // element rows
            for (int i = 0; i < n; ++i) {  // element cols
                // Bottom-left node of current square
                int bottom_left = j * nodes_per_direction + i;
                int bottom_right = bottom_left + 1;
                int top_left = bottom_left + nodes_per_direction;
                int top_right = top_left + 1;
                
                // lower-right triangle (counter-clockwise)
                elements(elem_idx, 0) = bottom_left;
                elements(elem_idx, 1) = bottom_right;
                elements(elem_idx, 2) = top_right;
                elem_idx++;

                // upper-left triangle (counter-clockwise)
                elements(elem_idx, 0) = bottom_left;
                elements(elem_idx, 1) = top_right;
                elements(elem_idx, 2) = top_left;
                elem_idx++;
            }
        }

        if (debug_) {
            std::cout << n << "x" << n << " Unit cell mesh created:" << std::endl;
            std::cout << "  Nodes: " << nodes.rows() << " (" << nodes_per_direction 
                      << "x" << nodes_per_direction << " grid)" << std::endl;
            std::cout << "  Elements: " << elements.rows() << std::endl;
            std::cout << "  Element size h = " << std::fixed << std::setprecision(6) << h << std::endl;
        }

        diameter_ = h;
    }

    Eigen::VectorXi uniform::tag_cells(
        const Eigen::MatrixXd& nodes,
        const Eigen::MatrixXi& elements,
        const InclusionFunction& inclusion
    ){
        Eigen::VectorXi tags(elements.rows());

        for (int e = 0; e < elements.rows(); ++e) {
            Eigen::MatrixXd coords(elements.cols(), 2);
            for (int i = 0; i < elements.cols(); ++i) {
                coords.row(i) = nodes.row(elements(e, i));
            }
            Eigen::Vector2d c = utils::operations::calcCentroid(coords);
            tags(e) = inclusion(c) ? 1 : 2;
        }

        return tags;
    }

    unit_cell uniform::create_unit_cell(int n, const InclusionFunction& inclusion){
        Eigen::MatrixXd nodes;
        Eigen::MatrixXi elements;
        create_square_nxn_mesh(nodes, elements, n);

        Eigen::VectorXi tags = tag_cells(nodes, elements, inclusion);

        if (debug_) {
            std::cout << "  Inclusion cells: " << (tags.array() == 1).count()
                      << " of " << tags.size() << std::endl;
        }

        return unit_cell(nodes, elements, tags);
    }

    uniform::InclusionFunction uniform::circular_inclusion(double radius){
        return [radius](const Eigen::Vector2d& x) {
            return (x - Eigen::Vector2d(0.5, 0.5)).norm() < radius;
        };
    }

    uniform::InclusionFunction uniform::square_inclusion(double side){
        double half = 0.5 * side;
        return [half](const Eigen::Vector2d& x) {
            return std::abs(x(0) - 0.5) < half && std::abs(x(1) - 0.5) < half;
        };
    }
}
