/**
 * @file permittivity.hpp
 * @brief Defines the piecewise-constant permittivity of the two phases
 */

#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef HOMCELL_MATERIAL_PERMITTIVITY_HPP
#define HOMCELL_MATERIAL_PERMITTIVITY_HPP

#include <string>

#include <Eigen/Dense>

namespace material{
    /**
     * @class permittivity
     * @brief Cell-wise permittivity looked up through the subdomain tags
     * 
     * Cells tagged 1 take the inclusion value, every other cell the matrix value.
     */
    class permittivity{
        public:
            /**
             * @brief Constructor
             * 
             * @param inner_permittivity Permittivity of the inclusion (tag 1)
             * @param outer_permittivity Permittivity of the matrix (tag 2)
             * @param subdomains Tag of every cell
             * @throws ConfigurationError if a permittivity is non-finite, zero or negative
             */
            permittivity(double inner_permittivity, double outer_permittivity, Eigen::VectorXi subdomains);

            // permittivity of a cell
            double value(int cell) const;

            double inner() const { return inner_; }
            double outer() const { return outer_; }

            int n_cells() const { return static_cast<int>(tags_.size()); }

            // reject values that make the cell problem ill-posed
            static void check_value(double value, const std::string& name);

        private:
            double inner_;
            double outer_;
            Eigen::VectorXi tags_;
    };
}

#endif
