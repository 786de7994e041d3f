/**
 * @file results.hpp
 * @brief Persists the effective tensor and the corrector fields
 */

#ifndef HOMCELL_UTILS_RESULTS_HPP
#define HOMCELL_UTILS_RESULTS_HPP

#include <map>
#include <string>

#include <Eigen/Dense>

#include "mesh/unit_cell.hpp"
#include "solver/homogenization.hpp"
#include "utils/config.hpp"

namespace utils {
    class results {
        public:
            /**
             * @brief Write the tensor as two lines of "%12.6e %12.6e \n"
             *
             * @throws std::runtime_error if the file cannot be written
             */
            static void writeEffectiveTensor(const Eigen::Matrix2d& tensor, const std::string& filename);

            // same text as writeEffectiveTensor
            static std::string formatEffectiveTensor(const Eigen::Matrix2d& tensor);

            /**
             * @brief Export mesh, tags, vertex values of both correctors and the tensor to JSON
             */
            static void exportCorrectorsToJson(
                const mesh::unit_cell& cell,
                const solver::HomogenizationResult& result,
                const std::string& filename
            );

            // key/value record of a run for utils::logging::buildLogFile
            static std::map<std::string, std::string> buildRunRecord(
                const settings& run_settings,
                const solver::HomogenizationResult& result
            );
    };
}

#endif
