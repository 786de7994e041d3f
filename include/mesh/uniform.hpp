#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef HOMCELL_UNIFORM_HPP
#define HOMCELL_UNIFORM_HPP

#include <cmath>
#include <functional>
#include <iomanip>
#include <iostream>

#include <Eigen/Dense>

#include "mesh/unit_cell.hpp"

namespace mesh {

class uniform{
    public:
        // predicate deciding whether a cell centroid lies in the inclusion
        using InclusionFunction = std::function<bool(const Eigen::Vector2d&)>;

        uniform(bool debug = false) : debug_(debug) {}
        ~uniform() = default;

        /**
         * @brief Create n×n structured triangle mesh on unit square
         * 
         * Every square is split along its bottom-left to top-right diagonal, so
         * the mesh is symmetric under x <-> y and meshes with n and 2n are nested.
         * 
         * @param nodes Output matrix for node coordinates  
         * @param elements Output matrix for element connectivity (counter-clockwise)
         * @param n Number of squares in each direction (creates 2n² triangles)
        */
        void create_square_nxn_mesh(Eigen::MatrixXd& nodes, Eigen::MatrixXi& elements, int n);

        /**
         * @brief Tag cells by centroid: 1 inside the inclusion, 2 elsewhere
         */
        static Eigen::VectorXi tag_cells(
            const Eigen::MatrixXd& nodes,
            const Eigen::MatrixXi& elements,
            const InclusionFunction& inclusion
        );

        // structured unit cell with the given inclusion
        unit_cell create_unit_cell(int n, const InclusionFunction& inclusion);

        // disc of the given radius centred at (0.5, 0.5)
        static InclusionFunction circular_inclusion(double radius);

        // axis-aligned square of the given side centred at (0.5, 0.5)
        static InclusionFunction square_inclusion(double side);

        double get_diameter() { return diameter_; }

    private:
        bool debug_ = false;
        double diameter_ = 0.0;
};

}

#endif
