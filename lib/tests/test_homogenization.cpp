#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include <Eigen/Dense>

#include "mesh/uniform.hpp"
#include "models/exceptions.hpp"
#include "solver/homogenization.hpp"
#include "utils/config.hpp"

namespace {
    const double inner = 1.0;
    const double outer = 11.7;

    utils::settings default_settings(){
        utils::settings settings;
        settings.inner_permittivity = inner;
        settings.outer_permittivity = outer;
        return settings;
    }

    // horizontal layer of the inclusion phase below y = 0.5
    mesh::uniform::InclusionFunction lower_layer(){
        return [](const Eigen::Vector2d& x) { return x(1) < 0.5; };
    }
}

TEST(HomogenizationTests, HomogeneousMediumRecoversCoefficient)
{
    utils::settings settings = default_settings();
    settings.outer_permittivity = 3.5;

    for (int n : {1, 3, 8}) {
        mesh::unit_cell cell = mesh::uniform().create_unit_cell(n, [](const Eigen::Vector2d&) { return false; });
        solver::HomogenizationResult result = solver::homogenization::run(cell, settings);

        EXPECT_NEAR(result.tensor(0, 0), 3.5, 1e-10) << "n = " << n;
        EXPECT_NEAR(result.tensor(1, 1), 3.5, 1e-10) << "n = " << n;
        EXPECT_EQ(result.tensor(0, 1), 0.0);
        EXPECT_EQ(result.tensor(1, 0), 0.0);
        EXPECT_LT(result.correctors[0].cwiseAbs().maxCoeff(), 1e-10);
        EXPECT_LT(result.correctors[1].cwiseAbs().maxCoeff(), 1e-10);
    }
}

TEST(HomogenizationTests, EqualPhasesGiveIdentity)
{
    utils::settings settings = default_settings();
    settings.inner_permittivity = 1.0;
    settings.outer_permittivity = 1.0;

    mesh::unit_cell cell = mesh::uniform().create_unit_cell(10, mesh::uniform::circular_inclusion(0.3));
    solver::HomogenizationResult result = solver::homogenization::run(cell, settings);

    EXPECT_TRUE(result.tensor.isApprox(Eigen::Matrix2d::Identity(), 1e-10));
}

TEST(HomogenizationTests, LaminateRecoversArithmeticAndHarmonicMeans)
{
    mesh::unit_cell cell = mesh::uniform().create_unit_cell(8, lower_layer());
    solver::HomogenizationResult result = solver::homogenization::run(cell, default_settings());

    double arithmetic = 0.5 * inner + 0.5 * outer;
    double harmonic = 1.0 / (0.5 / inner + 0.5 / outer);

    EXPECT_NEAR(result.tensor(0, 0), arithmetic, 1e-9);
    EXPECT_NEAR(result.tensor(1, 1), harmonic, 1e-9);
    EXPECT_EQ(result.tensor(0, 1), 0.0);
    EXPECT_EQ(result.tensor(1, 0), 0.0);
}

TEST(HomogenizationTests, CentredInclusionIsIsotropicAndBounded)
{
    for (auto inclusion : {mesh::uniform::circular_inclusion(0.25), mesh::uniform::square_inclusion(0.5)}) {
        mesh::unit_cell cell = mesh::uniform().create_unit_cell(16, inclusion);
        solver::HomogenizationResult result = solver::homogenization::run(cell, default_settings());

        EXPECT_NEAR(result.tensor(0, 0), result.tensor(1, 1), 1e-8);
        EXPECT_GT(result.tensor(0, 0), inner);
        EXPECT_LT(result.tensor(0, 0), outer);

        // Wiener bounds of the discrete volume fraction
        double fraction = 0.0;
        for (int c = 0; c < cell.n_cells(); ++c) {
            if (cell.tag(c) == 1) {
                Eigen::Matrix<double, 3, 2> v = cell.cell_vertices(c);
                fraction += 0.5 * std::abs((v(1, 0) - v(0, 0)) * (v(2, 1) - v(0, 1))
                                         - (v(2, 0) - v(0, 0)) * (v(1, 1) - v(0, 1)));
            }
        }
        double upper = fraction * inner + (1.0 - fraction) * outer;
        double lower = 1.0 / (fraction / inner + (1.0 - fraction) / outer);
        EXPECT_LE(result.tensor(0, 0), upper + 1e-10);
        EXPECT_GE(result.tensor(0, 0), lower - 1e-10);
    }
}

TEST(HomogenizationTests, ConvergesMonotonicallyUnderRefinement)
{
    std::vector<double> values;
    for (int n : {8, 16, 32}) {
        mesh::unit_cell cell = mesh::uniform().create_unit_cell(n, mesh::uniform::square_inclusion(0.5));
        solver::HomogenizationResult result = solver::homogenization::run(cell, default_settings());
        values.push_back(result.tensor(0, 0));
    }

    // nested spaces and an unchanged coefficient: the energy can only decrease
    EXPECT_LE(values[1], values[0] + 1e-10);
    EXPECT_LE(values[2], values[1] + 1e-10);
    EXPECT_LT(values[1] - values[2], values[0] - values[1]);
}

TEST(HomogenizationTests, DirectAndIterativeSolversAgree)
{
    mesh::unit_cell cell = mesh::uniform().create_unit_cell(16, mesh::uniform::circular_inclusion(0.3));

    utils::settings direct = default_settings();
    direct.solver_type = LinearSolverType::Direct;
    utils::settings iterative = default_settings();
    iterative.solver_type = LinearSolverType::Iterative;

    solver::HomogenizationResult a = solver::homogenization::run(cell, direct);
    solver::HomogenizationResult b = solver::homogenization::run(cell, iterative);

    EXPECT_NEAR(a.tensor(0, 0), b.tensor(0, 0), 1e-7);
    EXPECT_NEAR(a.tensor(1, 1), b.tensor(1, 1), 1e-7);
    EXPECT_EQ(a.statistics[0].iterations, 0);
    EXPECT_GT(b.statistics[0].iterations, 0);
}

TEST(HomogenizationTests, ParallelAndSequentialRunsAgree)
{
    mesh::unit_cell cell = mesh::uniform().create_unit_cell(12, mesh::uniform::circular_inclusion(0.35));

    utils::settings parallel = default_settings();
    parallel.parallel_directions = true;
    utils::settings sequential = default_settings();
    sequential.parallel_directions = false;

    solver::HomogenizationResult a = solver::homogenization::run(cell, parallel);
    solver::HomogenizationResult b = solver::homogenization::run(cell, sequential);

    EXPECT_NEAR(a.tensor(0, 0), b.tensor(0, 0), 1e-14);
    EXPECT_NEAR(a.tensor(1, 1), b.tensor(1, 1), 1e-14);
}

TEST(HomogenizationTests, ResultCarriesCountsAndVertexValues)
{
    mesh::unit_cell cell = mesh::uniform().create_unit_cell(5, mesh::uniform::circular_inclusion(0.3));
    solver::HomogenizationResult result = solver::homogenization::run(cell, default_settings());

    EXPECT_EQ(result.n_dofs, 25);
    EXPECT_EQ(result.n_slaves, 11);
    EXPECT_EQ(result.n_cells, 50);
    EXPECT_EQ(result.n_vertices, 36);
    EXPECT_EQ(result.vertex_correctors[0].size(), 36);
    EXPECT_EQ(result.vertex_correctors[1].size(), 36);
}

TEST(HomogenizationTests, InvalidSettingsAreRejected)
{
    mesh::unit_cell cell = mesh::uniform().create_unit_cell(2, mesh::uniform::circular_inclusion(0.3));

    utils::settings settings = default_settings();
    settings.outer_permittivity = 0.0;
    EXPECT_THROW(solver::homogenization::run(cell, settings), ConfigurationError);

    settings = default_settings();
    settings.inner_permittivity = -1.0;
    EXPECT_THROW(solver::homogenization::run(cell, settings), ConfigurationError);

    settings = default_settings();
    settings.tolerance = 0.0;
    EXPECT_THROW(solver::homogenization::run(cell, settings), ConfigurationError);
}
