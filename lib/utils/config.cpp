#include "utils/config.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include "material/permittivity.hpp"
#include "models/exceptions.hpp"

namespace utils {
    settings config::readJson(const std::string& filepath){
        using json = nlohmann::json;

        // load json data
        std::ifstream input_file(filepath);
        if (!input_file) {
            throw ConfigurationError("Cannot open configuration file " + filepath);
        }

        json j;
        try {
            input_file >> j;
        } catch (const json::exception& e) {
            throw ConfigurationError("Cannot parse configuration file " + filepath + ": " + e.what());
        }

        settings s = fromJson(j);

        // mesh paths are relative to the configuration file
        std::filesystem::path mesh_path(s.mesh_file);
        if (!s.mesh_file.empty() && mesh_path.is_relative()) {
            s.mesh_file = (std::filesystem::path(filepath).parent_path() / mesh_path).string();
        }

        return s;
    }

    settings config::fromJson(const nlohmann::json& j){
        using json = nlohmann::json;

        if (!j.is_object()) {
            throw ConfigurationError("Configuration must be a JSON object");
        }

        settings s;

        try {
            s.inner_permittivity = j.value("inner_permittivity", s.inner_permittivity);
            s.outer_permittivity = j.value("outer_permittivity", s.outer_permittivity);

            s.mesh_file = j.value("mesh_file", s.mesh_file);
            s.mesh_group = j.value("mesh_group", s.mesh_group);
            s.subdomain_group = j.value("subdomain_group", s.subdomain_group);

            if (j.contains("mesh_format")) {
                std::string format = j["mesh_format"].get<std::string>();
                if (format == "json") {
                    s.mesh_format = MeshFormat::Json;
                } else if (format == "hdf5") {
                    s.mesh_format = MeshFormat::Hdf5;
                } else {
                    throw ConfigurationError("Unknown mesh_format '" + format + "', expected json or hdf5");
                }
            } else {
                s.mesh_format = inferMeshFormat(s.mesh_file);
            }

            if (j.contains("solver")) {
                std::string solver = j["solver"].get<std::string>();
                if (solver == "direct") {
                    s.solver_type = LinearSolverType::Direct;
                } else if (solver == "iterative") {
                    s.solver_type = LinearSolverType::Iterative;
                } else {
                    throw ConfigurationError("Unknown solver '" + solver + "', expected direct or iterative");
                }
            }

            s.tolerance = j.value("tolerance", s.tolerance);
            s.max_iterations = j.value("max_iterations", s.max_iterations);
            s.periodic_tolerance = j.value("periodic_tolerance", s.periodic_tolerance);
            s.parallel_directions = j.value("parallel_directions", s.parallel_directions);

            s.effective_file = j.value("effective_file", s.effective_file);
            s.corrector_file = j.value("corrector_file", s.corrector_file);
            s.log_directory = j.value("log_directory", s.log_directory);

            s.debug = j.value("debug", s.debug);
        } catch (const json::exception& e) {
            throw ConfigurationError(std::string("Invalid configuration value: ") + e.what());
        }

        validate(s);

        return s;
    }

    MeshFormat config::inferMeshFormat(const std::string& filepath){
        std::string::size_type dot = filepath.find_last_of('.');
        if (dot != std::string::npos) {
            std::string extension = filepath.substr(dot);
            if (extension == ".h5" || extension == ".hdf5") {
                return MeshFormat::Hdf5;
            }
        }
        return MeshFormat::Json;
    }

    void config::validate(const settings& s){
        material::permittivity::check_value(s.inner_permittivity, "inner_permittivity");
        material::permittivity::check_value(s.outer_permittivity, "outer_permittivity");

        if (!(s.tolerance > 0.0)) {
            throw ConfigurationError("tolerance must be positive");
        }
        if (s.max_iterations < 1) {
            throw ConfigurationError("max_iterations must be at least 1");
        }
        if (!(s.periodic_tolerance > 0.0) || s.periodic_tolerance >= 0.5) {
            std::ostringstream msg;
            msg << "periodic_tolerance must lie in (0, 0.5), got " << s.periodic_tolerance;
            throw ConfigurationError(msg.str());
        }
    }
}
