#include "libthetamap/numeric_inverse.hpp"

#include <Eigen/Core>
#include <LBFGSB.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <limits>
#include <map>
#include <numeric>
#include <random>
#include <stdexcept>
#include <utility>

namespace libthetamap {

namespace {

class DisjointSets {
public:
    explicit DisjointSets(std::size_t size) : parent_(size) {
        std::iota(parent_.begin(), parent_.end(), std::size_t{0});
    }

    std::size_t find(std::size_t x) {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    void unite(std::size_t a, std::size_t b) {
        a = find(a);
        b = find(b);
        if (a != b) {
            parent_[std::max(a, b)] = std::min(a, b);
        }
    }

private:
    std::vector<std::size_t> parent_;
};

struct EvaluationLimitReached : std::runtime_error {
    EvaluationLimitReached() : std::runtime_error("function evaluation limit reached") {}
};

// Carries an exception thrown by a psi function through the solver untouched.
struct PsiFunctionFailed {
    std::exception_ptr error;
};

// Sum of squared psi residuals over the slots of one component, with a
// central-difference gradient. Keeps the best point seen so that a solver
// failure still leaves a usable estimate.
class ResidualFunctor {
public:
    ResidualFunctor(const std::vector<PsiDefinition>& psi,
                    const std::vector<std::size_t>& psi_slots,
                    const std::vector<double>& psi_targets,
                    const std::vector<std::size_t>& component,
                    std::vector<double> theta,
                    const Eigen::VectorXd& lower,
                    const Eigen::VectorXd& upper,
                    std::size_t max_evaluations)
        : psi_(psi),
          psi_slots_(psi_slots),
          psi_targets_(psi_targets),
          component_(component),
          theta_(std::move(theta)),
          lower_(lower),
          upper_(upper),
          max_evaluations_(max_evaluations) {}

    double operator()(const Eigen::VectorXd& x, Eigen::VectorXd& grad) {
        const double value = objective(x);
        Eigen::VectorXd probe = x;
        for (Eigen::Index i = 0; i < x.size(); ++i) {
            const double step = 1e-7 * std::max(1.0, std::abs(x[i]));
            const double up = std::min(x[i] + step, upper_[i]);
            const double down = std::max(x[i] - step, lower_[i]);
            probe[i] = up;
            const double f_up = objective(probe);
            probe[i] = down;
            const double f_down = objective(probe);
            probe[i] = x[i];
            grad[i] = (up > down) ? (f_up - f_down) / (up - down) : 0.0;
        }
        return value;
    }

    [[nodiscard]] std::vector<double> residuals(const Eigen::VectorXd& x) const {
        std::vector<double> theta = theta_;
        for (std::size_t i = 0; i < component_.size(); ++i) {
            theta[component_[i]] = x[static_cast<Eigen::Index>(i)];
        }
        std::vector<double> result(psi_slots_.size());
        for (std::size_t j = 0; j < psi_slots_.size(); ++j) {
            const auto slot = psi_slots_[j];
            result[j] = psi_[slot](theta) - psi_targets_[slot];
        }
        return result;
    }

    [[nodiscard]] std::size_t evaluations() const noexcept { return evaluations_; }

    [[nodiscard]] const Eigen::VectorXd& best_point() const noexcept { return best_point_; }

    [[nodiscard]] double best_value() const noexcept { return best_value_; }

private:
    double objective(const Eigen::VectorXd& x) {
        if (evaluations_ >= max_evaluations_) {
            throw EvaluationLimitReached();
        }
        ++evaluations_;
        std::vector<double> values;
        try {
            values = residuals(x);
        } catch (...) {
            throw PsiFunctionFailed{std::current_exception()};
        }
        double sum_sq = 0.0;
        for (double r : values) {
            sum_sq += r * r;
        }
        if (!std::isfinite(sum_sq)) {
            sum_sq = std::numeric_limits<double>::max();
        }
        if (sum_sq < best_value_) {
            best_value_ = sum_sq;
            best_point_ = x;
        }
        return sum_sq;
    }

    const std::vector<PsiDefinition>& psi_;
    const std::vector<std::size_t>& psi_slots_;
    const std::vector<double>& psi_targets_;
    const std::vector<std::size_t>& component_;
    std::vector<double> theta_;
    const Eigen::VectorXd& lower_;
    const Eigen::VectorXd& upper_;
    std::size_t max_evaluations_;
    std::size_t evaluations_{0};
    double best_value_{std::numeric_limits<double>::infinity()};
    Eigen::VectorXd best_point_;
};

[[nodiscard]] double random_start(double lower, double upper, std::mt19937& rng) {
    std::normal_distribution<double> normal(0.0, 1.0);
    const bool finite_lower = std::isfinite(lower);
    const bool finite_upper = std::isfinite(upper);
    if (finite_lower && finite_upper) {
        std::uniform_real_distribution<double> uniform(lower, upper);
        return uniform(rng);
    }
    if (finite_lower) {
        return lower + std::abs(normal(rng));
    }
    if (finite_upper) {
        return upper - std::abs(normal(rng));
    }
    return normal(rng);
}

[[nodiscard]] double max_abs(const std::vector<double>& values) {
    double result = 0.0;
    for (double v : values) {
        result = std::max(result, std::abs(v));
    }
    return std::isnan(result) ? std::numeric_limits<double>::infinity() : result;
}

}  // namespace

std::vector<std::vector<std::size_t>> codetermined_components(const std::vector<PsiDefinition>& psi,
                                                              const std::vector<bool>& unresolved) {
    const std::size_t n_theta = unresolved.size();
    DisjointSets sets(n_theta);
    for (const auto& definition : psi) {
        std::size_t anchor = n_theta;
        for (auto theta_index : definition.theta_indexes) {
            if (theta_index >= n_theta) {
                throw std::out_of_range("psi definition reads theta beyond its length");
            }
            if (!unresolved[theta_index]) {
                continue;
            }
            if (anchor == n_theta) {
                anchor = theta_index;
            } else {
                sets.unite(anchor, theta_index);
            }
        }
    }

    std::map<std::size_t, std::vector<std::size_t>> by_root;
    for (std::size_t i = 0; i < n_theta; ++i) {
        if (unresolved[i]) {
            by_root[sets.find(i)].push_back(i);
        }
    }
    // Roots are the smallest member, so map order is component order.
    std::vector<std::vector<std::size_t>> components;
    components.reserve(by_root.size());
    for (auto& entry : by_root) {
        components.push_back(std::move(entry.second));
    }
    return components;
}

NumericInverseSolver::NumericInverseSolver(SolverOptions options)
    : options_(std::move(options)) {
    if (options_.max_iterations == 0 || options_.restarts == 0 || !(options_.tolerance >= 0.0) ||
        !(options_.residual_tolerance > 0.0) || options_.max_linesearch <= 0) {
        throw std::invalid_argument("invalid solver options");
    }
}

ComponentFit NumericInverseSolver::solve(const std::vector<PsiDefinition>& psi,
                                         const std::vector<double>& psi_targets,
                                         const std::vector<std::size_t>& component,
                                         const std::vector<double>& theta,
                                         const std::vector<double>& lower,
                                         const std::vector<double>& upper,
                                         std::size_t component_number) const {
    if (component.empty()) {
        throw std::invalid_argument("cannot solve for an empty component");
    }
    if (psi_targets.size() != psi.size()) {
        throw std::invalid_argument("psi target size mismatch");
    }
    if (lower.size() != theta.size() || upper.size() != theta.size()) {
        throw std::logic_error("theta bound vectors do not match theta");
    }

    std::vector<std::size_t> psi_slots;
    for (std::size_t j = 0; j < psi.size(); ++j) {
        for (auto member : component) {
            if (psi[j].reads(member)) {
                psi_slots.push_back(j);
                break;
            }
        }
    }

    const auto n = static_cast<Eigen::Index>(component.size());
    Eigen::VectorXd lb(n);
    Eigen::VectorXd ub(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        lb[i] = lower[component[static_cast<std::size_t>(i)]];
        ub[i] = upper[component[static_cast<std::size_t>(i)]];
    }

    const std::size_t max_evaluations = options_.max_function_evaluations > 0
                                            ? options_.max_function_evaluations
                                            : 10000 * component.size();

    LBFGSpp::LBFGSBParam<double> param;
    param.epsilon = options_.tolerance;
    param.epsilon_rel = options_.tolerance;
    param.max_iterations = static_cast<int>(options_.max_iterations);
    param.max_linesearch = options_.max_linesearch;

    const std::uint32_t base_seed = options_.random_seed ? *options_.random_seed : std::random_device{}();

    ComponentFit fit;
    fit.theta_indexes = component;
    fit.residual = std::numeric_limits<double>::infinity();

    for (std::size_t restart = 0; restart < options_.restarts; ++restart) {
        std::seed_seq seed{base_seed, static_cast<std::uint32_t>(component_number),
                           static_cast<std::uint32_t>(restart)};
        std::mt19937 rng(seed);
        Eigen::VectorXd x(n);
        for (Eigen::Index i = 0; i < n; ++i) {
            x[i] = random_start(lb[i], ub[i], rng);
        }

        ResidualFunctor functor(psi, psi_slots, psi_targets, component, theta, lb, ub, max_evaluations);
        LBFGSpp::LBFGSBSolver<double> solver(param);
        double fx = 0.0;
        int niter = 0;
        bool converged = true;
        std::string message = "converged";
        try {
            niter = solver.minimize(functor, x, fx, lb, ub);
            if (niter >= param.max_iterations) {
                converged = false;
                message = "iteration limit reached";
            }
        } catch (const PsiFunctionFailed& failed) {
            std::rethrow_exception(failed.error);
        } catch (const EvaluationLimitReached& e) {
            converged = false;
            message = e.what();
        } catch (const std::runtime_error& e) {
            // Line search failures end the solve early.
            converged = false;
            message = e.what();
        } catch (const std::logic_error& e) {
            converged = false;
            message = e.what();
        }

        const Eigen::VectorXd& best = functor.best_point().size() == n ? functor.best_point() : x;
        const double residual = max_abs(functor.residuals(best));

        if (options_.verbose) {
            std::cout << "Numeric inverse component " << component_number << " start " << restart
                      << ": residual=" << residual << " iterations=" << niter
                      << " evaluations=" << functor.evaluations() << " (" << message << ")" << std::endl;
        }

        if (fit.values.empty() || residual < fit.residual) {
            fit.values.assign(best.data(), best.data() + best.size());
            fit.residual = residual;
            fit.iterations = static_cast<std::size_t>(niter);
            fit.function_evaluations = functor.evaluations();
            fit.converged = converged;
            fit.message = message;
        }
        if (fit.residual <= options_.residual_tolerance) {
            break;
        }
    }

    return fit;
}

}  // namespace libthetamap
