#include "utils/linear_solver.hpp"

#include <chrono>
#include <algorithm>
#include <cmath>

#include "models/exceptions.hpp"

namespace utils {
    // ============================================================================
    // CONSTRUCTORS AND DESTRUCTOR
    // ============================================================================

    linear_solver::linear_solver(
        LinearSolverType solver_type,
        double tolerance,
        int max_iterations
    ) {
        configure_solver(solver_type, tolerance, max_iterations);
    }

    void linear_solver::configure_solver(
        LinearSolverType solver_type,
        double tolerance,
        int max_iterations
    ){
        if (!(tolerance > 0.0) || !std::isfinite(tolerance)) {
            throw ConfigurationError("Solver tolerance must be positive, got " + std::to_string(tolerance));
        }
        if (max_iterations < 1) {
            throw ConfigurationError("Solver needs at least one iteration, got " + std::to_string(max_iterations));
        }

        solver_type_ = solver_type;
        tolerance_ = tolerance;
        max_iterations_ = max_iterations;

        if (debug_mode_) {
            debug_print("Solver configured:");
            debug_print("  Type: " + std::string(solver_type_ == LinearSolverType::Direct ? "Direct" : "Iterative"));
            debug_print("  Tolerance: " + std::to_string(tolerance_));
            debug_print("  Max iterations: " + std::to_string(max_iterations_));
        }
    }

    // ============================================================================
    // SOLVE
    // ============================================================================

    void linear_solver::solve(
        const Eigen::SparseMatrix<double>& A,
        const Eigen::VectorXd& b,
        Eigen::VectorXd& x
    ){
        if (A.rows() != A.cols()) {
            throw std::invalid_argument("Matrix must be square");
        }
        if (A.rows() != b.size()) {
            throw std::invalid_argument("Matrix and right-hand side must have same dimensions");
        }

        auto start_time = std::chrono::high_resolution_clock::now();

        statistics_ = Statistics();

        if (solver_type_ == LinearSolverType::Direct) {
            solve_direct(A, b, x);
        } else {
            solve_iterative(A, b, x);
        }

        check_solution(A, b, x);

        auto end_time = std::chrono::high_resolution_clock::now();
        statistics_.solve_time = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time).count() / 1000.0;

        if (debug_mode_) {
            debug_print("Solved " + std::to_string(A.rows()) + " unknowns in "
                + std::to_string(statistics_.solve_time) + " ms, relative residual "
                + std::to_string(statistics_.relative_residual));
        }
    }

    void linear_solver::solve_direct(
        const Eigen::SparseMatrix<double>& A,
        const Eigen::VectorXd& b,
        Eigen::VectorXd& x
    ){
        Eigen::SimplicialLDLT<Eigen::SparseMatrix<double>> solver;
        solver.compute(A);

        if (solver.info() != Eigen::Success) {
            debug_print("Matrix factorization failed");
            throw SingularSystemError("Sparse LDL^T factorization failed on a "
                + std::to_string(A.rows()) + "x" + std::to_string(A.cols()) + " system");
        }

        // zero pivots slip through SimplicialLDLT without an error flag
        Eigen::VectorXd d = solver.vectorD();
        double d_max = d.cwiseAbs().maxCoeff();
        if (!(d_max > 0.0) || (d.cwiseAbs().array() <= 1e-14 * d_max).any()) {
            throw SingularSystemError("Sparse LDL^T factorization found a zero pivot: system is rank deficient");
        }

        x = solver.solve(b);

        if (solver.info() != Eigen::Success) {
            debug_print("Linear system solve failed");
            throw SingularSystemError("Sparse LDL^T back substitution failed");
        }
    }

    void linear_solver::solve_iterative(
        const Eigen::SparseMatrix<double>& A,
        const Eigen::VectorXd& b,
        Eigen::VectorXd& x
    ){
        Eigen::ConjugateGradient<Eigen::SparseMatrix<double>, Eigen::Lower | Eigen::Upper,
                                 Eigen::DiagonalPreconditioner<double>> solver;
        solver.setMaxIterations(max_iterations_);
        solver.setTolerance(tolerance_);
        solver.compute(A);

        if (solver.info() != Eigen::Success) {
            debug_print("Matrix preconditioning failed");
            throw SingularSystemError("Conjugate gradient preconditioner setup failed");
        }

        if (x.size() != b.size()) {
            x = Eigen::VectorXd::Zero(b.size());
        }
        x = solver.solveWithGuess(b, x);

        statistics_.iterations = static_cast<int>(solver.iterations());
        statistics_.estimated_error = solver.error();

        if (solver.info() != Eigen::Success) {
            debug_print("Iterative solver failed. Iterations: " + std::to_string(solver.iterations()) + 
                       ", Error: " + std::to_string(solver.error()));
            throw SingularSystemError("Conjugate gradient did not converge in "
                + std::to_string(solver.iterations()) + " iterations (error "
                + std::to_string(solver.error()) + ")");
        }

        if (debug_mode_ && solver.iterations() > max_iterations_ * 0.8) {
            debug_print("Solver required many iterations: " + std::to_string(solver.iterations()));
        }
    }

    void linear_solver::check_solution(
        const Eigen::SparseMatrix<double>& A,
        const Eigen::VectorXd& b,
        const Eigen::VectorXd& x
    ){
        if (!x.allFinite()) {
            throw SingularSystemError("Linear solve produced non-finite values");
        }

        double b_norm = b.norm();
        double r_norm = (A * x - b).norm();
        statistics_.relative_residual = b_norm > 0.0 ? r_norm / b_norm : r_norm;

        // the iterative tolerance is relative to b; allow round-off headroom on top of it
        double accepted = std::max(1e-6, 100.0 * tolerance_);
        if (statistics_.relative_residual > accepted) {
            throw SingularSystemError("Relative residual " + std::to_string(statistics_.relative_residual)
                + " exceeds " + std::to_string(accepted));
        }
    }

    void linear_solver::debug_print(const std::string& message) const {
        if (debug_mode_) {
            std::cout << "[DEBUG] Linear Solver: " << message << std::endl;
        }
    }
}
