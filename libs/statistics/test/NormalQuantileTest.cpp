// NormalQuantileTest.cpp
//
// Unit tests for the standard normal helpers used by sample-size planning:
//  - benchstat::analysis::detail::compute_normal_quantile (Acklam's algorithm)
//  - benchstat::analysis::detail::compute_normal_cdf
//  - benchstat::analysis::detail::compute_two_sided_critical_value

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <stdexcept>
#include <vector>

#include "NormalQuantile.h"

using Catch::Approx;
using benchstat::analysis::detail::compute_normal_cdf;
using benchstat::analysis::detail::compute_normal_quantile;
using benchstat::analysis::detail::compute_two_sided_critical_value;

TEST_CASE("compute_normal_quantile: standard critical values", "[NormalQuantile][quantile]")
{
    REQUIRE(compute_normal_quantile(0.5) == 0.0);
    REQUIRE(compute_normal_quantile(0.975) == Approx(1.959963985).margin(1e-8));
    REQUIRE(compute_normal_quantile(0.80) == Approx(0.841621234).margin(1e-8));
    REQUIRE(compute_normal_quantile(0.90) == Approx(1.281551566).margin(1e-8));
    REQUIRE(compute_normal_quantile(0.995) == Approx(2.575829304).margin(1e-8));
}

TEST_CASE("compute_normal_quantile: symmetry and tails", "[NormalQuantile][quantile]")
{
    for (double p : {0.001, 0.01, 0.02, 0.1, 0.3, 0.45})
    {
        INFO("p = " << p);
        REQUIRE(compute_normal_quantile(p) == Approx(-compute_normal_quantile(1.0 - p)).margin(1e-9));
        REQUIRE(compute_normal_quantile(p) < 0.0);
    }

    // Deep tail uses the tail branch of the approximation.
    REQUIRE(compute_normal_quantile(1e-6) == Approx(-4.753424309).margin(1e-7));
}

TEST_CASE("compute_normal_quantile: rejects probabilities outside (0,1)", "[NormalQuantile][errors]")
{
    REQUIRE_THROWS_AS(compute_normal_quantile(0.0), std::domain_error);
    REQUIRE_THROWS_AS(compute_normal_quantile(1.0), std::domain_error);
    REQUIRE_THROWS_AS(compute_normal_quantile(-0.2), std::domain_error);
    REQUIRE_THROWS_AS(compute_normal_quantile(std::nan("")), std::domain_error);
}

TEST_CASE("compute_normal_cdf inverts the quantile", "[NormalQuantile][cdf]")
{
    REQUIRE(compute_normal_cdf(0.0) == Approx(0.5));
    REQUIRE(compute_normal_cdf(1.959963985) == Approx(0.975).margin(1e-9));

    const std::vector<double> probabilities = {0.01, 0.05, 0.25, 0.5, 0.75, 0.95, 0.99};
    for (double p : probabilities)
    {
        INFO("p = " << p);
        REQUIRE(compute_normal_cdf(compute_normal_quantile(p)) == Approx(p).margin(1e-9));
    }
}

TEST_CASE("compute_two_sided_critical_value", "[NormalQuantile][critical]")
{
    REQUIRE(compute_two_sided_critical_value(0.05) == Approx(1.959963985).margin(1e-8));
    REQUIRE(compute_two_sided_critical_value(0.01) == Approx(2.575829304).margin(1e-8));
    REQUIRE_THROWS_AS(compute_two_sided_critical_value(0.0), std::domain_error);
    REQUIRE_THROWS_AS(compute_two_sided_critical_value(1.0), std::domain_error);
}
