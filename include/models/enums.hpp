/**
 * @file enums.hpp
 * @brief Defines enumerations used throughout the library
 */

#ifndef HOMCELL_MODELS_ENUMS_HPP
#define HOMCELL_MODELS_ENUMS_HPP

/**
 * @enum LinearSolverType
 * @brief Enumeration of the sparse solvers available for the corrector systems
 */
enum class LinearSolverType {
    /**
     * @brief Sparse LDL^T factorization
     */
    Direct,

    /**
     * @brief Conjugate gradient with diagonal preconditioning
     */
    Iterative
};

/**
 * @enum MeshFormat
 * @brief Enumeration of the supported unit cell file formats
 */
enum class MeshFormat {
    /**
     * @brief JSON file with nodes, elements and subdomains arrays
     */
    Json,

    /**
     * @brief HDF5 container with mesh and subdomain groups
     */
    Hdf5
};

#endif // HOMCELL_MODELS_ENUMS_HPP
