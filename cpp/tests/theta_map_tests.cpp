#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <Eigen/Dense>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "libthetamap/theta_map.hpp"

namespace {

using libthetamap::SystemParameter;

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

libthetamap::StateSpace local_level(double z, double h, double t, double q) {
    return libthetamap::StateSpace(Eigen::MatrixXd::Constant(1, 1, z).eval(), Eigen::MatrixXd::Constant(1, 1, h).eval(),
                                   Eigen::MatrixXd::Constant(1, 1, t).eval(), Eigen::MatrixXd::Constant(1, 1, q).eval());
}

double entry(const libthetamap::StateSpace& system, SystemParameter parameter, Eigen::Index row = 0,
             Eigen::Index col = 0) {
    return system[parameter].slices.front()(row, col);
}

}  // namespace

TEST_CASE("ThetaMap for_all_parameters round-trips a system", "[theta_map]") {
    const auto system = local_level(1.0, 2.0, 0.9, 0.5);
    const auto map = libthetamap::ThetaMap::for_all_parameters(system);

    // Z, d, H, T, c, R, Q
    REQUIRE(map.n_theta() == 7);
    REQUIRE(map.n_psi() == 7);
    REQUIRE_FALSE(map.explicit_a0());
    REQUIRE(map.transforms().size() == 2);

    const auto theta = map.system_to_theta(system);
    REQUIRE(theta.size() == 7);
    const auto rebuilt = map.theta_to_system(theta);
    for (auto parameter : {SystemParameter::Z, SystemParameter::d, SystemParameter::H, SystemParameter::T,
                           SystemParameter::c, SystemParameter::R, SystemParameter::Q}) {
        REQUIRE(entry(rebuilt, parameter) == Catch::Approx(entry(system, parameter)).margin(1e-12));
    }
    REQUIRE_FALSE(rebuilt.has_a0());
    REQUIRE_FALSE(rebuilt.has_P0());
}

TEST_CASE("ThetaMap keeps free variances positive", "[theta_map]") {
    const auto map = libthetamap::ThetaMap::for_all_parameters(local_level(1.0, 1.0, 1.0, 1.0));

    const auto H_slot = map.transformation_index()[SystemParameter::H].slices.front()(0, 0);
    REQUIRE(map.transforms().at(static_cast<std::size_t>(H_slot)) ==
            libthetamap::BoundTransform{libthetamap::LowerBoundedTransform(libthetamap::kVarianceFloor)});
    REQUIRE(entry(map.lower_bound(), SystemParameter::H) == libthetamap::kVarianceFloor);
    REQUIRE(entry(map.lower_bound(), SystemParameter::T) == -std::numeric_limits<double>::infinity());

    const auto system = map.theta_to_system(std::vector<double>(7, -50.0));
    REQUIRE(entry(system, SystemParameter::H) > 0.0);
    REQUIRE(entry(system, SystemParameter::Q) > 0.0);
    REQUIRE(entry(system, SystemParameter::T) == -50.0);
}

TEST_CASE("ThetaMap parameterizes covariances on the lower triangle", "[theta_map]") {
    const Eigen::MatrixXd Z = Eigen::MatrixXd::Identity(2, 2);
    const Eigen::MatrixXd H = Eigen::MatrixXd::Constant(2, 2, kNaN);
    const Eigen::MatrixXd T = 0.5 * Eigen::MatrixXd::Identity(2, 2);
    const Eigen::MatrixXd Q = Eigen::MatrixXd::Constant(2, 2, kNaN);
    const auto map = libthetamap::ThetaMap::for_estimation(libthetamap::EstimationSystem(libthetamap::StateSpace(Z, H, T, Q)));

    // H(0,0), H(1,0), H(1,1), then the same for Q
    REQUIRE(map.n_theta() == 6);
    for (auto parameter : {SystemParameter::H, SystemParameter::Q}) {
        const auto& index = map.index()[parameter].slices.front();
        REQUIRE(index(0, 1) == index(1, 0));
        REQUIRE(index(0, 0) != index(1, 1));
    }

    const auto system = map.theta_to_system({0.0, 0.3, std::log(2.0), 0.0, -0.2, 0.0});
    const auto& covariance = system[SystemParameter::H].slices.front();
    REQUIRE(covariance(0, 1) == Catch::Approx(0.3));
    REQUIRE(covariance(1, 0) == Catch::Approx(0.3));
    REQUIRE(covariance(0, 0) == Catch::Approx(1.0));
    REQUIRE(covariance(1, 1) == Catch::Approx(2.0));
    REQUIRE(std::isinf(entry(map.lower_bound(), SystemParameter::H, 0, 1)));

    const auto& shocks = system[SystemParameter::Q].slices.front();
    REQUIRE(shocks(0, 1) == shocks(1, 0));
    REQUIRE(shocks(1, 0) == -0.2);
    REQUIRE(shocks(1, 1) == Catch::Approx(1.0));

    const auto theta = map.system_to_theta(system);
    REQUIRE(theta[1] == Catch::Approx(0.3));
    REQUIRE(theta[2] == Catch::Approx(std::log(2.0)).margin(1e-12));
    REQUIRE(theta[4] == -0.2);
}

TEST_CASE("ThetaMap shares slots between entries naming one variable", "[theta_map]") {
    libthetamap::EstimationSystem estimation(local_level(kNaN, kNaN, 1.0, 1.0));
    estimation.set_entry(SystemParameter::Z, 0, 0, libthetamap::FreeVariable{"phi"});
    estimation.set_entry(SystemParameter::T, 0, 0, libthetamap::FreeVariable{"phi"});
    const auto map = libthetamap::ThetaMap::for_estimation(estimation);

    REQUIRE(map.n_theta() == 2);
    REQUIRE(map.theta_names() == std::vector<std::string>{"phi", "theta_2"});
    REQUIRE(map.parameter_report() == std::vector<std::string>{"Z, T", "H"});

    const auto system = map.theta_to_system({0.6, 0.0});
    REQUIRE(entry(system, SystemParameter::Z) == 0.6);
    REQUIRE(entry(system, SystemParameter::T) == 0.6);

    const auto theta = map.system_to_theta(local_level(0.5, 1.0, 0.5, 1.0));
    REQUIRE(theta[0] == Catch::Approx(0.5));

    REQUIRE_THROWS_AS(map.system_to_theta(local_level(0.5, 1.0, 0.6, 1.0)), libthetamap::InconsistentSystem);
}

TEST_CASE("ThetaMap shares one psi slot between entries of an expression", "[theta_map]") {
    libthetamap::EstimationSystem estimation(local_level(1.0, 1.0, 1.0, 1.0));
    const libthetamap::PsiFunction exponential = [](const std::vector<double>& x) { return std::exp(x[0]); };
    const libthetamap::PsiInverse logarithm = [](double psi) { return std::log(psi); };
    estimation.set_entry(SystemParameter::Z, 0, 0, libthetamap::Expression{"e", {"a"}, exponential, logarithm});
    estimation.set_entry(SystemParameter::T, 0, 0, libthetamap::Expression{"e", {"a"}, exponential, logarithm});
    const auto map = libthetamap::ThetaMap::for_estimation(estimation);

    REQUIRE(map.n_theta() == 1);
    REQUIRE(map.n_psi() == 1);
    REQUIRE(map.theta_names() == std::vector<std::string>{"a"});
    REQUIRE(map.parameter_report() == std::vector<std::string>{"Z, T"});

    const auto system = map.theta_to_system({0.7});
    REQUIRE(entry(system, SystemParameter::Z) == Catch::Approx(std::exp(0.7)));
    REQUIRE(entry(system, SystemParameter::T) == entry(system, SystemParameter::Z));

    // The inverse is closed form, so nothing is solved numerically.
    const auto recovery = map.recover_theta(system);
    REQUIRE(recovery.components.empty());
    REQUIRE(recovery.accurate());
    REQUIRE(recovery.theta[0] == Catch::Approx(0.7));

    try {
        (void)map.system_to_theta(local_level(2.0, 1.0, 3.0, 1.0));
        FAIL("expected an inconsistent system");
    } catch (const libthetamap::InconsistentSystem& error) {
        REQUIRE(std::string(error.what()).find("Z, T") != std::string::npos);
    }
}

TEST_CASE("ThetaMap rejects an expression key reused with other variables", "[theta_map]") {
    libthetamap::EstimationSystem estimation(local_level(1.0, 1.0, 1.0, 1.0));
    const libthetamap::PsiFunction exponential = [](const std::vector<double>& x) { return std::exp(x[0]); };
    estimation.set_entry(SystemParameter::Z, 0, 0, libthetamap::Expression{"e", {"a"}, exponential, {}});
    estimation.set_entry(SystemParameter::T, 0, 0, libthetamap::Expression{"e", {"b"}, exponential, {}});
    REQUIRE_THROWS_AS(libthetamap::ThetaMap::for_estimation(estimation), std::invalid_argument);
}

TEST_CASE("ThetaMap reports bound violations by matrix", "[theta_map]") {
    const auto map = libthetamap::ThetaMap::for_all_parameters(local_level(1.0, 1.0, 1.0, 1.0));

    try {
        (void)map.system_to_theta(local_level(1.0, -1.0, 1.0, -2.0));
        FAIL("expected a bound violation");
    } catch (const libthetamap::BoundViolation& error) {
        REQUIRE(error.side() == libthetamap::BoundSide::Lower);
        REQUIRE(error.parameters() == std::vector<std::string>{"H", "Q"});
        REQUIRE(std::string(error.what()).find("H, Q") != std::string::npos);
    }

    const auto bounded = map.add_restrictions(map.fixed().filled(-std::numeric_limits<double>::infinity()),
                                              map.fixed().filled(5.0));
    try {
        (void)bounded.system_to_theta(local_level(1.0, 1.0, 6.0, 1.0));
        FAIL("expected a bound violation");
    } catch (const libthetamap::BoundViolation& error) {
        REQUIRE(error.side() == libthetamap::BoundSide::Upper);
        REQUIRE(error.parameters() == std::vector<std::string>{"T"});
    }
}

TEST_CASE("ThetaMap applies logistic transforms inside two-sided bounds", "[theta_map]") {
    const auto map = libthetamap::ThetaMap::for_estimation(libthetamap::EstimationSystem(local_level(1.0, 1.0, kNaN, 1.0)));
    REQUIRE(map.n_theta() == 1);

    auto bounds = [&map](double lower, double upper) {
        return map.add_restrictions(map.fixed().filled(-std::numeric_limits<double>::infinity())
                                        .with(SystemParameter::T, libthetamap::StateSpace::Matrix(
                                                                      Eigen::MatrixXd::Constant(1, 1, lower))),
                                    map.fixed().filled(std::numeric_limits<double>::infinity())
                                        .with(SystemParameter::T, libthetamap::StateSpace::Matrix(
                                                                      Eigen::MatrixXd::Constant(1, 1, upper))));
    };

    const auto unit = bounds(0.0, 1.0);
    REQUIRE(entry(unit.theta_to_system({0.0}), SystemParameter::T) == Catch::Approx(0.5));
    REQUIRE(unit.system_to_theta(local_level(1.0, 1.0, 0.8, 1.0))[0] == Catch::Approx(std::log(4.0)));

    const auto symmetric = bounds(-1.0, 1.0);
    REQUIRE(entry(symmetric.theta_to_system({0.0}), SystemParameter::T) == Catch::Approx(0.0).margin(1e-15));
    const auto theta = symmetric.system_to_theta(local_level(1.0, 1.0, -0.4, 1.0));
    REQUIRE(entry(symmetric.theta_to_system(theta), SystemParameter::T) == Catch::Approx(-0.4));

    // A value exactly on a bound maps to an infinite psi.
    REQUIRE(std::isinf(unit.system_to_theta(local_level(1.0, 1.0, 1.0, 1.0))[0]));
}

TEST_CASE("ThetaMap recovers expressions without inverse numerically", "[theta_map]") {
    libthetamap::EstimationSystem estimation(local_level(1.0, 1.0, 1.0, 1.0));
    const libthetamap::PsiFunction product = [](const std::vector<double>& x) { return x[0] * x[1]; };
    estimation.set_entry(SystemParameter::Z, 0, 0, libthetamap::Expression{"ab", {"a", "b"}, product, {}});
    estimation.set_entry(SystemParameter::d, 0, 0, libthetamap::FreeVariable{"a"});
    const auto map = libthetamap::ThetaMap::for_estimation(estimation);

    REQUIRE(map.theta_names() == std::vector<std::string>{"a", "b"});
    REQUIRE(map.n_psi() == 2);

    auto system = local_level(6.0, 1.0, 1.0, 1.0);
    system = system.with(SystemParameter::d, libthetamap::StateSpace::Matrix(Eigen::MatrixXd::Constant(1, 1, 2.0)));

    libthetamap::SolverOptions options;
    options.random_seed = 11;
    options.restarts = 5;
    const auto recovery = map.recover_theta(system, options);
    REQUIRE(recovery.accurate());
    REQUIRE(recovery.components.size() == 1);
    REQUIRE(recovery.components.front().theta_indexes == std::vector<std::size_t>{1});
    REQUIRE(recovery.theta[0] == Catch::Approx(2.0));
    REQUIRE(recovery.theta[1] == Catch::Approx(3.0).margin(1e-4));
    REQUIRE(recovery.psi == std::vector<double>{6.0, 2.0});
}

TEST_CASE("ThetaMap warns when the numeric inverse misses", "[theta_map]") {
    libthetamap::EstimationSystem estimation(local_level(1.0, 1.0, 1.0, 1.0));
    const libthetamap::PsiFunction cube = [](const std::vector<double>& x) { return x[0] * x[0] * x[0]; };
    estimation.set_entry(SystemParameter::T, 0, 0, libthetamap::Expression{"cube", {"a"}, cube, {}});
    const auto map = libthetamap::ThetaMap::for_estimation(estimation).set_theta_bounds("a", -1.0, 1.0);

    REQUIRE(map.theta_lower_bound() == std::vector<double>{-1.0});

    libthetamap::SolverOptions options;
    options.random_seed = 3;
    const auto recovery = map.recover_theta(local_level(1.0, 1.0, 8.0, 1.0), options);
    REQUIRE_FALSE(recovery.accurate());
    REQUIRE(recovery.warnings.size() == 1);
    REQUIRE(recovery.warnings.front().find("a") != std::string::npos);
    REQUIRE(recovery.max_residual == Catch::Approx(7.0).margin(1e-2));
    REQUIRE(recovery.theta[0] == Catch::Approx(1.0).margin(1e-3));
}

TEST_CASE("ThetaMap restricts theta through its bounds", "[theta_map]") {
    libthetamap::EstimationSystem estimation(local_level(1.0, 1.0, kNaN, 1.0));
    estimation.set_entry(SystemParameter::T, 0, 0, libthetamap::FreeVariable{"phi"});
    estimation.set_entry(SystemParameter::d, 0, 0, libthetamap::FreeVariable{"mu"});
    auto map = libthetamap::ThetaMap::for_estimation(estimation);

    // d precedes T in the canonical order.
    REQUIRE(map.theta_names() == std::vector<std::string>{"mu", "phi"});

    map = map.set_theta_bounds("phi", -1.0, 1.0).set_theta_bounds(0, 0.0, std::nullopt);
    REQUIRE(map.theta_upper_bound()[0] == std::numeric_limits<double>::infinity());

    const auto theta = map.restrict_theta({0.0, 0.0});
    REQUIRE(theta[0] == Catch::Approx(1.0));
    REQUIRE(theta[1] == Catch::Approx(0.0).margin(1e-15));

    const auto unconstrained = map.unrestrict_theta({2.0, 0.5});
    REQUIRE(unconstrained[0] == Catch::Approx(std::log(2.0)));
    REQUIRE(unconstrained[1] == Catch::Approx(std::log(3.0)));

    const auto gradient = map.restricted_theta_gradient({0.0, 0.0});
    REQUIRE(gradient.rows() == 2);
    REQUIRE(gradient(0, 0) == Catch::Approx(1.0));
    REQUIRE(gradient(1, 1) == Catch::Approx(0.5));
    REQUIRE(gradient(0, 1) == 0.0);

    REQUIRE_THROWS_AS(map.unrestrict_theta({-1.0, 0.0}), std::out_of_range);
    REQUIRE_THROWS_AS(map.set_theta_bounds("sigma", 0.0, 1.0), std::invalid_argument);
    REQUIRE_THROWS_AS(map.set_theta_bounds(5, 0.0, 1.0), std::out_of_range);
}

TEST_CASE("ThetaMap preserves period selectors of time-varying matrices", "[theta_map]") {
    auto system = local_level(1.0, 1.0, 1.0, 1.0);
    libthetamap::StateSpace::Matrix T({Eigen::MatrixXd::Constant(1, 1, 0.2), Eigen::MatrixXd::Constant(1, 1, 0.7)},
                                      {0, 1, 1});
    system = system.with(SystemParameter::T, T);
    const auto map = libthetamap::ThetaMap::for_all_parameters(system);
    REQUIRE(map.n_theta() == 8);

    const auto rebuilt = map.theta_to_system(map.system_to_theta(system));
    REQUIRE(rebuilt[SystemParameter::T].tau == std::vector<std::size_t>{0, 1, 1});
    REQUIRE(rebuilt[SystemParameter::T].at_period(2)(0, 0) == Catch::Approx(0.7));
}

TEST_CASE("ThetaMap rejects malformed inputs", "[theta_map]") {
    const auto map = libthetamap::ThetaMap::for_all_parameters(local_level(1.0, 1.0, 1.0, 1.0));

    REQUIRE_THROWS_AS(map.theta_to_system({1.0, 2.0}), std::invalid_argument);
    REQUIRE_THROWS_AS(map.theta_to_system(std::vector<double>(7, kNaN)), std::invalid_argument);
    REQUIRE_THROWS_AS(map.system_to_theta(local_level(1.0, 1.0, kNaN, 1.0)), std::invalid_argument);

    Eigen::MatrixXd Z(2, 1);
    Z << 1.0, 1.0;
    const Eigen::MatrixXd H = Eigen::MatrixXd::Identity(2, 2);
    const Eigen::MatrixXd T = Eigen::MatrixXd::Identity(1, 1);
    REQUIRE_THROWS_AS(map.system_to_theta(libthetamap::StateSpace(Z, H, T, T)), std::invalid_argument);
}

TEST_CASE("ThetaMap validates caller-built structures", "[theta_map]") {
    const auto fixed = local_level(1.0, 1.0, 0.0, 1.0);
    const auto one = libthetamap::IndexStateSpace::Matrix(Eigen::MatrixXi::Constant(1, 1, 1));
    const auto index = fixed.filled<int>(0).with(SystemParameter::T, one);

    libthetamap::ThetaMapOptions options;
    options.names = {"rho"};
    const libthetamap::ThetaMap map({fixed, index, index}, libthetamap::TransformRegistry::identity_only(), options);
    REQUIRE(map.n_theta() == 1);
    REQUIRE(map.theta_names().front() == "rho");
    REQUIRE(entry(map.theta_to_system({0.4}), SystemParameter::T) == 0.4);

    const auto nonzero = fixed.with(SystemParameter::T, libthetamap::StateSpace::Matrix(Eigen::MatrixXd::Ones(1, 1)));
    REQUIRE_THROWS_AS(libthetamap::ThetaMap({nonzero, index, index}, libthetamap::TransformRegistry::identity_only()),
                      std::invalid_argument);

    const auto two = fixed.filled<int>(0).with(SystemParameter::T,
                                               libthetamap::IndexStateSpace::Matrix(Eigen::MatrixXi::Constant(1, 1, 2)));
    REQUIRE_THROWS_AS(libthetamap::ThetaMap({fixed, index, two}, libthetamap::TransformRegistry::identity_only()),
                      std::invalid_argument);
}
