/**
 * @file config.hpp
 * @brief Run configuration of the homogenization pipeline and its JSON reader
 */

#ifndef HOMCELL_UTILS_CONFIG_HPP
#define HOMCELL_UTILS_CONFIG_HPP

#include <string>

#include <nlohmann/json.hpp>

#include "models/enums.hpp"

namespace utils {
    /**
     * @brief Parameters of one homogenization run
     *
     * Programmatic callers fill the struct directly; the driver reads it from
     * a JSON file with config::readJson.
     */
    struct settings {
        // Phase permittivities
        double inner_permittivity = 1.0;
        double outer_permittivity = 11.7;

        // Mesh input
        std::string mesh_file;
        MeshFormat mesh_format = MeshFormat::Json;
        std::string mesh_group = "mesh";
        std::string subdomain_group = "subdomains";

        // Linear solver
        LinearSolverType solver_type = LinearSolverType::Direct;
        double tolerance = 1e-10;
        int max_iterations = 5000;

        // Coordinate tolerance for periodic vertex matching
        double periodic_tolerance = 1e-10;

        // Solve the two directions on separate threads
        bool parallel_directions = true;

        // Outputs (empty string disables the output)
        std::string effective_file = "effective";
        std::string corrector_file;
        std::string log_directory;

        bool debug = false;
    };

    class config {
        public:
            /**
             * @brief Read a run configuration from a JSON file
             *
             * @param filepath Path to the JSON file
             * @throws ConfigurationError if the file cannot be parsed or a value is invalid
             */
            static settings readJson(const std::string& filepath);

            /**
             * @brief Build a run configuration from parsed JSON; absent keys keep their defaults
             */
            static settings fromJson(const nlohmann::json& j);

            // mesh format from the file extension (.h5/.hdf5 -> Hdf5, otherwise Json)
            static MeshFormat inferMeshFormat(const std::string& filepath);

            // check permittivities and solver parameters
            static void validate(const settings& s);
    };
}

#endif
