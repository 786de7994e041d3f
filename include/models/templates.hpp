/**
 * @file templates.hpp
 * @brief Defines data structures shared by the assembler and the integrator
 */

#ifndef HOMCELL_MODELS_TEMPLATES_HPP
#define HOMCELL_MODELS_TEMPLATES_HPP

#include <array>

#include <Eigen/Dense>

// Element-specific data for a linear triangle
    struct ElementData {
        Eigen::Matrix<double, 3, 2> gradients; // Constant gradients of the three P1 basis functions
        double area; // Element area
        double permittivity; // Coefficient value on the element
        std::array<int, 3> dofs; // Global (periodic) DOF of each vertex

        // Local stiffness matrix
        Eigen::Matrix3d K_local;
    };

#endif
