#ifndef HOMCELL_LINEAR_SOLVER_HPP
#define HOMCELL_LINEAR_SOLVER_HPP


#include <string>
#include <iostream>
#include <Eigen/Dense>
#include <Eigen/Sparse>

#include "models/enums.hpp"

namespace utils {

    class linear_solver {
    public:
        /**
         * @brief Solve statistics of the last call
         */
        struct Statistics {
            int iterations = 0;
            double estimated_error = 0.0;
            double relative_residual = 0.0;
            double solve_time = 0.0; // milliseconds
        };

        // ============================================================================
        // CONSTRUCTORS AND DESTRUCTOR
        // ============================================================================

        linear_solver(
            LinearSolverType solver_type = LinearSolverType::Direct,
            double tolerance = 1e-10,
            int max_iterations = 5000
        );

        ~linear_solver() = default; // Destructor

        // ============================================================================
        // SOLVER CONFIGURATION
        // ============================================================================

        void configure_solver(
            LinearSolverType solver_type,
            double tolerance,
            int max_iterations
        );

        /**
         * @brief Set debug mode for detailed output
         * @param enable_debug True to enable debug output, false to disable
         */
        void set_debug_mode(bool enable_debug) {
            debug_mode_ = enable_debug;
        }

        /**
         * @brief Get the statistics of the last solve
         * @return Reference to the statistics object
         */
        const Statistics& get_statistics() const {
            return statistics_;
        }

        LinearSolverType get_solver_type() const { return solver_type_; }
        double get_tolerance() const { return tolerance_; }

        // ============================================================================
        // SOLVE
        // ============================================================================

        /**
         * @brief Solve A x = b for a symmetric positive definite sparse A
         *
         * @param A System matrix (both triangles stored)
         * @param b Right-hand side
         * @param x Solution (input: initial guess for the iterative solver)
         * @throws SingularSystemError if factorization or iteration fails, the
         *         solution is not finite, or the relative residual exceeds the
         *         accepted bound
         */
        void solve(
            const Eigen::SparseMatrix<double>& A,
            const Eigen::VectorXd& b,
            Eigen::VectorXd& x
        );

    private:
        LinearSolverType solver_type_;
        double tolerance_;
        int max_iterations_;
        bool debug_mode_ = false;
        Statistics statistics_;

        void solve_direct(const Eigen::SparseMatrix<double>& A, const Eigen::VectorXd& b, Eigen::VectorXd& x);
        void solve_iterative(const Eigen::SparseMatrix<double>& A, const Eigen::VectorXd& b, Eigen::VectorXd& x);
        void check_solution(const Eigen::SparseMatrix<double>& A, const Eigen::VectorXd& b, const Eigen::VectorXd& x);

        void debug_print(const std::string& message) const;
    };
}

#endif
