#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

#include "libthetamap/numeric_inverse.hpp"

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

libthetamap::PsiDefinition product_of(std::size_t a, std::size_t b) {
    libthetamap::PsiDefinition definition;
    definition.theta_indexes = {a, b};
    definition.evaluate = [](const std::vector<double>& x) { return x[0] * x[1]; };
    return definition;
}

libthetamap::PsiDefinition cube_of(std::size_t a) {
    libthetamap::PsiDefinition definition;
    definition.theta_indexes = {a};
    definition.evaluate = [](const std::vector<double>& x) { return x[0] * x[0] * x[0]; };
    return definition;
}

}  // namespace

TEST_CASE("codetermined_components links theta read by one psi", "[numeric_inverse]") {
    const std::vector<libthetamap::PsiDefinition> psi{
        libthetamap::PsiDefinition::identity(0), product_of(1, 3), cube_of(2), product_of(3, 4)};

    std::vector<bool> unresolved{false, true, true, true, true};
    const auto components = libthetamap::codetermined_components(psi, unresolved);
    REQUIRE(components.size() == 2);
    REQUIRE(components[0] == std::vector<std::size_t>{1, 3, 4});
    REQUIRE(components[1] == std::vector<std::size_t>{2});

    // Resolved slots do not link their neighbours.
    unresolved[3] = false;
    const auto split = libthetamap::codetermined_components(psi, unresolved);
    REQUIRE(split.size() == 3);
    REQUIRE(split[0] == std::vector<std::size_t>{1});
    REQUIRE(split[2] == std::vector<std::size_t>{4});
}

TEST_CASE("NumericInverseSolver inverts a single slot", "[numeric_inverse]") {
    const std::vector<libthetamap::PsiDefinition> psi{cube_of(0)};
    const std::vector<double> targets{8.0};

    libthetamap::SolverOptions options;
    options.random_seed = 42;
    options.restarts = 5;
    const libthetamap::NumericInverseSolver solver(options);
    const auto fit = solver.solve(psi, targets, {0}, {kNaN}, {-kInf}, {kInf}, 0);

    REQUIRE(fit.theta_indexes == std::vector<std::size_t>{0});
    REQUIRE(fit.values[0] == Catch::Approx(2.0).margin(1e-3));
    REQUIRE(fit.residual <= options.residual_tolerance);
    REQUIRE(fit.function_evaluations > 0);
}

TEST_CASE("NumericInverseSolver solves a codetermined pair using known theta", "[numeric_inverse]") {
    // psi_0 = theta_0 * theta_1, psi_1 = theta_1 * theta_2 with theta_2 known.
    const std::vector<libthetamap::PsiDefinition> psi{product_of(0, 1), product_of(1, 2)};
    const std::vector<double> targets{6.0, 9.0};

    libthetamap::SolverOptions options;
    options.random_seed = 7;
    options.restarts = 5;
    const libthetamap::NumericInverseSolver solver(options);
    const auto fit = solver.solve(psi, targets, {0, 1}, {kNaN, kNaN, 3.0}, {0.0, 0.0, -kInf},
                                  {10.0, 10.0, kInf}, 0);

    REQUIRE(fit.values.size() == 2);
    REQUIRE(fit.values[0] == Catch::Approx(2.0).margin(1e-3));
    REQUIRE(fit.values[1] == Catch::Approx(3.0).margin(1e-3));
}

TEST_CASE("NumericInverseSolver honours theta bounds and reports residuals", "[numeric_inverse]") {
    // The cube root of 8 lies outside [-1, 1]; the best bounded fit sits on the bound.
    const std::vector<libthetamap::PsiDefinition> psi{cube_of(0)};
    libthetamap::SolverOptions options;
    options.random_seed = 1;
    const libthetamap::NumericInverseSolver solver(options);
    const auto fit = solver.solve(psi, {8.0}, {0}, {kNaN}, {-1.0}, {1.0}, 0);

    REQUIRE(fit.values[0] <= 1.0);
    REQUIRE(fit.values[0] == Catch::Approx(1.0).margin(1e-3));
    REQUIRE(fit.residual == Catch::Approx(7.0).margin(1e-2));
}

TEST_CASE("NumericInverseSolver rejects bad options and inputs", "[numeric_inverse]") {
    libthetamap::SolverOptions options;
    options.restarts = 0;
    REQUIRE_THROWS_AS(libthetamap::NumericInverseSolver(options), std::invalid_argument);

    const libthetamap::NumericInverseSolver solver;
    const std::vector<libthetamap::PsiDefinition> psi{cube_of(0)};
    REQUIRE_THROWS_AS(solver.solve(psi, {1.0}, {}, {kNaN}, {-kInf}, {kInf}, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(solver.solve(psi, {1.0, 2.0}, {0}, {kNaN}, {-kInf}, {kInf}, 0), std::invalid_argument);
}

TEST_CASE("NumericInverseSolver lets psi function errors through", "[numeric_inverse]") {
    libthetamap::PsiDefinition failing;
    failing.theta_indexes = {0};
    failing.evaluate = [](const std::vector<double>&) -> double { throw std::domain_error("psi undefined"); };
    const std::vector<libthetamap::PsiDefinition> psi{failing};

    libthetamap::SolverOptions options;
    options.random_seed = 5;
    const libthetamap::NumericInverseSolver solver(options);
    REQUIRE_THROWS_AS(solver.solve(psi, {1.0}, {0}, {kNaN}, {-kInf}, {kInf}, 0), std::domain_error);
}
