/**
 * @file datasource.hpp
 * @brief Defines the datasource class for unit cell mesh I/O
 */

#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef HOMCELL_MESH_DATASOURCE_HPP
#define HOMCELL_MESH_DATASOURCE_HPP

#include <string>

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

#include "mesh/unit_cell.hpp"
#include "utils/config.hpp"

namespace mesh {
    /**
     * @class datasource
     * @brief Reads and writes unit cell meshes with their subdomain tags
     *
     * Two containers are supported: a JSON file
     *
     *     {"nodes": [[x, y], ...], "elements": [[i, j, k], ...], "subdomains": [t, ...]}
     *
     * with 0-based vertex indices, and an HDF5 file holding
     * <mesh>/coordinates, <mesh>/topology and <subdomains>/values.
     * Every read failure is reported as MeshLoadError.
     */
    class datasource{
        public:
            /**
             * @brief Read a unit cell from a JSON file
             *
             * @param filepath Path to the JSON file
             * @throws MeshLoadError if the file is unreadable or the data is inconsistent
             */
            static unit_cell readJson(const std::string& filepath);

            /**
             * @brief Build a unit cell from parsed JSON
             */
            static unit_cell fromJson(const nlohmann::json& j);

            /**
             * @brief Read a unit cell from an HDF5 container
             *
             * @param filepath Path to the HDF5 file
             * @param mesh_group Group holding the coordinates and topology datasets
             * @param subdomain_group Group holding the values dataset
             * @throws MeshLoadError if a dataset is missing or has the wrong shape
             */
            static unit_cell readHdf5(
                const std::string& filepath,
                const std::string& mesh_group = "mesh",
                const std::string& subdomain_group = "subdomains"
            );

            // read the mesh named by a run configuration
            static unit_cell load(const utils::settings& settings);

            /**
             * @brief Export a unit cell to a JSON file readable by readJson
             *
             * @param cell Mesh and tags to write
             * @param filename Output path
             */
            static void exportUnitCellToJson(const unit_cell& cell, const std::string& filename);
    };
}

#endif
