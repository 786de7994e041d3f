#include <gtest/gtest.h>

#include <limits>

#include <Eigen/Dense>

#include "material/permittivity.hpp"
#include "models/exceptions.hpp"

TEST(PermittivityTests, LooksUpValueThroughTag)
{
    Eigen::VectorXi tags(4);
    tags << 1, 2, 2, 1;
    material::permittivity coefficient(1.0, 11.7, tags);

    EXPECT_EQ(coefficient.n_cells(), 4);
    EXPECT_DOUBLE_EQ(coefficient.value(0), 1.0);
    EXPECT_DOUBLE_EQ(coefficient.value(1), 11.7);
    EXPECT_DOUBLE_EQ(coefficient.value(2), 11.7);
    EXPECT_DOUBLE_EQ(coefficient.value(3), 1.0);
    EXPECT_DOUBLE_EQ(coefficient.inner(), 1.0);
    EXPECT_DOUBLE_EQ(coefficient.outer(), 11.7);

    EXPECT_THROW(coefficient.value(4), std::out_of_range);
    EXPECT_THROW(coefficient.value(-1), std::out_of_range);
}

TEST(PermittivityTests, RejectsNonPositiveValues)
{
    Eigen::VectorXi tags = Eigen::VectorXi::Constant(2, 2);

    EXPECT_THROW(material::permittivity(1.0, 0.0, tags), ConfigurationError);
    EXPECT_THROW(material::permittivity(-1.0, 11.7, tags), ConfigurationError);
    EXPECT_THROW(material::permittivity(std::numeric_limits<double>::infinity(), 11.7, tags), ConfigurationError);
    EXPECT_THROW(material::permittivity(1.0, std::numeric_limits<double>::quiet_NaN(), tags), ConfigurationError);
    EXPECT_NO_THROW(material::permittivity(1e-3, 1e3, tags));
}

TEST(PermittivityTests, ConfigurationErrorCarriesStage)
{
    try {
        material::permittivity::check_value(0.0, "outer_permittivity");
        FAIL() << "expected ConfigurationError";
    } catch (const homcell_error& e) {
        EXPECT_EQ(e.stage(), "configuration");
        EXPECT_NE(std::string(e.what()).find("outer_permittivity"), std::string::npos);
    }
}
