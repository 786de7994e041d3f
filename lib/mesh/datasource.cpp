#include "mesh/datasource.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <vector>

#include <hdf5.h>

#include "models/exceptions.hpp"

namespace {
    // closes an HDF5 handle when leaving scope
    class hdf5_handle {
        public:
            hdf5_handle(hid_t id, herr_t (*close)(hid_t)) : id_(id), close_(close) {}
            ~hdf5_handle() {
                if (id_ >= 0) {
                    close_(id_);
                }
            }

            hdf5_handle(const hdf5_handle&) = delete;
            hdf5_handle& operator=(const hdf5_handle&) = delete;

            hid_t get() const { return id_; }
            bool valid() const { return id_ >= 0; }

        private:
            hid_t id_;
            herr_t (*close_)(hid_t);
    };

    // read a 1D or 2D dataset into a row-major buffer, returns its dimensions
    template <typename T>
    std::vector<hsize_t> readDataset(
        hid_t file_id,
        const std::string& path,
        hid_t memory_type,
        std::vector<T>& buffer
    ){
        if (H5Lexists(file_id, path.c_str(), H5P_DEFAULT) <= 0) {
            throw MeshLoadError("HDF5 dataset " + path + " not found");
        }

        hdf5_handle dataset(H5Dopen2(file_id, path.c_str(), H5P_DEFAULT), H5Dclose);
        if (!dataset.valid()) {
            throw MeshLoadError("Cannot open HDF5 dataset " + path);
        }

        hdf5_handle dataspace(H5Dget_space(dataset.get()), H5Sclose);
        int rank = H5Sget_simple_extent_ndims(dataspace.get());
        if (rank < 1 || rank > 2) {
            throw MeshLoadError("HDF5 dataset " + path + " has rank " + std::to_string(rank)
                + ", expected 1 or 2");
        }

        std::vector<hsize_t> dims(rank);
        H5Sget_simple_extent_dims(dataspace.get(), dims.data(), nullptr);

        hsize_t count = 1;
        for (hsize_t d : dims) {
            count *= d;
        }
        buffer.resize(count);

        if (count > 0 && H5Dread(dataset.get(), memory_type, H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer.data()) < 0) {
            throw MeshLoadError("Cannot read HDF5 dataset " + path);
        }

        return dims;
    }
}

mesh::unit_cell mesh::datasource::readJson(const std::string& filepath){
    using json = nlohmann::json;

    // load json data
    std::ifstream input_file(filepath);
    if (!input_file) {
        throw MeshLoadError("Cannot open mesh file " + filepath);
    }

    json j;
    try {
        input_file >> j;
    } catch (const json::exception& e) {
        throw MeshLoadError("Cannot parse mesh file " + filepath + ": " + e.what());
    }

    return fromJson(j);
}

mesh::unit_cell mesh::datasource::fromJson(const nlohmann::json& j){
    using json = nlohmann::json;

    for (const char* key : {"nodes", "elements", "subdomains"}) {
        if (!j.contains(key) || !j[key].is_array()) {
            throw MeshLoadError(std::string("Mesh JSON is missing the '") + key + "' array");
        }
    }

    const json& nodes_values = j["nodes"];
    const json& elements_values = j["elements"];
    const json& subdomain_values = j["subdomains"];

    Eigen::MatrixXd nodes(nodes_values.size(), 2);
    Eigen::MatrixXi elements(elements_values.size(), 3);
    Eigen::VectorXi subdomains(subdomain_values.size());

    try {
        // fill node matrix with values
        for (size_t i = 0; i < nodes_values.size(); i++) {
            if (!nodes_values[i].is_array() || nodes_values[i].size() != 2) {
                throw MeshLoadError("Node " + std::to_string(i) + " must have 2 coordinates");
            }
            nodes(i, 0) = nodes_values[i][0].get<double>();
            nodes(i, 1) = nodes_values[i][1].get<double>();
        }

        // fill element matrix with vertex indices
        for (size_t i = 0; i < elements_values.size(); i++) {
            if (!elements_values[i].is_array() || elements_values[i].size() != 3) {
                throw MeshLoadError("Element " + std::to_string(i) + " must have 3 vertices");
            }
            for (int k = 0; k < 3; k++) {
                elements(i, k) = elements_values[i][k].get<int>();
            }
        }

        for (size_t i = 0; i < subdomain_values.size(); i++) {
            subdomains(i) = subdomain_values[i].get<int>();
        }
    } catch (const json::exception& e) {
        throw MeshLoadError(std::string("Invalid value in mesh JSON: ") + e.what());
    }

    return unit_cell(nodes, elements, subdomains);
}

mesh::unit_cell mesh::datasource::readHdf5(
    const std::string& filepath,
    const std::string& mesh_group,
    const std::string& subdomain_group
){
    // errors are reported through MeshLoadError, not the HDF5 error stack
    H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr);

    if (!std::filesystem::exists(filepath)) {
        throw MeshLoadError("Cannot open mesh file " + filepath);
    }

    hdf5_handle file(H5Fopen(filepath.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT), H5Fclose);
    if (!file.valid()) {
        throw MeshLoadError("Cannot open HDF5 file " + filepath);
    }

    for (const std::string& group : {mesh_group, subdomain_group}) {
        if (H5Lexists(file.get(), group.c_str(), H5P_DEFAULT) <= 0) {
            throw MeshLoadError("HDF5 group " + group + " not found in " + filepath);
        }
    }

    std::vector<double> coordinates;
    std::vector<int> topology;
    std::vector<int> values;

    std::vector<hsize_t> node_dims = readDataset(file.get(), mesh_group + "/coordinates", H5T_NATIVE_DOUBLE, coordinates);
    std::vector<hsize_t> cell_dims = readDataset(file.get(), mesh_group + "/topology", H5T_NATIVE_INT, topology);
    std::vector<hsize_t> tag_dims = readDataset(file.get(), subdomain_group + "/values", H5T_NATIVE_INT, values);

    if (node_dims.size() != 2 || node_dims[1] != 2) {
        throw MeshLoadError("coordinates must be an N x 2 dataset");
    }
    if (cell_dims.size() != 2 || cell_dims[1] != 3) {
        throw MeshLoadError("topology must be an M x 3 dataset");
    }
    if (tag_dims.size() != 1 && !(tag_dims.size() == 2 && tag_dims[1] == 1)) {
        throw MeshLoadError("subdomain values must be a one-dimensional dataset");
    }

    // HDF5 buffers are row-major
    Eigen::MatrixXd nodes = Eigen::Map<Eigen::Matrix<double, Eigen::Dynamic, 2, Eigen::RowMajor>>(
        coordinates.data(), static_cast<Eigen::Index>(node_dims[0]), 2);
    Eigen::MatrixXi elements = Eigen::Map<Eigen::Matrix<int, Eigen::Dynamic, 3, Eigen::RowMajor>>(
        topology.data(), static_cast<Eigen::Index>(cell_dims[0]), 3);
    Eigen::VectorXi subdomains = Eigen::Map<Eigen::VectorXi>(values.data(), static_cast<Eigen::Index>(values.size()));

    return unit_cell(nodes, elements, subdomains);
}

mesh::unit_cell mesh::datasource::load(const utils::settings& settings){
    if (settings.mesh_file.empty()) {
        throw ConfigurationError("No mesh_file given");
    }

    if (settings.mesh_format == MeshFormat::Hdf5) {
        return readHdf5(settings.mesh_file, settings.mesh_group, settings.subdomain_group);
    }
    return readJson(settings.mesh_file);
}

void mesh::datasource::exportUnitCellToJson(const unit_cell& cell, const std::string& filename){
    using json = nlohmann::json;
    json j;

    // Export nodes
    json jsonNodes = json::array();
    for (int i = 0; i < cell.n_nodes(); i++) {
        jsonNodes.push_back({cell.nodes()(i, 0), cell.nodes()(i, 1)});
    }
    j["nodes"] = jsonNodes;

    // Export elements
    json jsonElements = json::array();
    for (int i = 0; i < cell.n_cells(); i++) {
        jsonElements.push_back({cell.elements()(i, 0), cell.elements()(i, 1), cell.elements()(i, 2)});
    }
    j["elements"] = jsonElements;

    std::vector<int> tags(cell.subdomains().data(), cell.subdomains().data() + cell.subdomains().size());
    j["subdomains"] = tags;

    // Write to file
    std::filesystem::path dir = std::filesystem::path(filename).parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir);
    }

    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + filename);
    }
    file << std::setw(4) << j << std::endl;
}
