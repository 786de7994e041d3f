#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef HOMCELL_OPERATIONS_HPP
#define HOMCELL_OPERATIONS_HPP

#include <cmath>
#include <iostream>
#include <Eigen/Dense>

#include "models/templates.hpp"

namespace utils {
    class operations{
    public:
        // ============================================================================
        // GEOMETRIC OPERATIONS
        // ============================================================================
        // calculate a polygon area (signed, positive for counter-clockwise ordering)
        static double calcArea(const Eigen::MatrixXd& coords);

        // calculate the centroid
        static Eigen::Vector2d calcCentroid(const Eigen::MatrixXd& coords);

        // Calculate triangle area
        static double compute_triangle_area(
            Eigen::Vector2d v0, 
            Eigen::Vector2d v1, 
            Eigen::Vector2d v2){
                double area = 0.5 * std::abs((v1 - v0).x() * (v2 - v0).y() - (v2 - v0).x() * (v1 - v0).y());
                return area;
            }

        // absolute comparison used for every coordinate test of the unit cell
        static bool near(double a, double b, double tolerance){
            return std::abs(a - b) < tolerance;
        }

        // ============================================================================
        // LINEAR TRIANGLE
        // ============================================================================

        /**
         * @brief Gradients of the three barycentric basis functions of a triangle
         *
         * Row i holds grad(phi_i), constant over the element. The gradients do not
         * depend on the vertex ordering: a clockwise triangle yields the same rows.
         *
         * @param vertices 3x2 matrix of vertex coordinates
         * @param signed_area Signed area of the triangle (must be non-zero)
         * @return 3x2 matrix of basis gradients
         */
        static Eigen::Matrix<double, 3, 2> compute_p1_gradients(
            const Eigen::Matrix<double, 3, 2>& vertices,
            double signed_area
        );

        /**
         * @brief Fill geometry of an element: area and basis gradients
         *
         * @param vertices 3x2 matrix of vertex coordinates
         * @param element_data Element data to fill
         * @return false if the triangle is degenerate (zero or non-finite area)
         */
        static bool setup_triangle(
            const Eigen::Matrix<double, 3, 2>& vertices,
            ElementData& element_data
        );
    };
}

#endif
