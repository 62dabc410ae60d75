#pragma once

#include <Eigen/Dense>

#include <algorithm>
#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace libthetamap {

enum class SystemParameter : std::size_t {
    Z,
    d,
    beta,
    H,
    T,
    c,
    gamma,
    R,
    Q,
    a0,
    P0
};

inline constexpr std::size_t kParameterCount = 11;

inline constexpr std::array<SystemParameter, kParameterCount> kAllParameters{
    SystemParameter::Z, SystemParameter::d, SystemParameter::beta, SystemParameter::H,
    SystemParameter::T, SystemParameter::c, SystemParameter::gamma, SystemParameter::R,
    SystemParameter::Q, SystemParameter::a0, SystemParameter::P0};

[[nodiscard]] std::string_view parameter_name(SystemParameter parameter) noexcept;

/// H, Q and P0: free entries are parameterized on and below the diagonal only.
[[nodiscard]] bool is_symmetric_parameter(SystemParameter parameter) noexcept;

[[nodiscard]] bool is_initial_parameter(SystemParameter parameter) noexcept;

[[nodiscard]] constexpr std::size_t parameter_position(SystemParameter parameter) noexcept {
    return static_cast<std::size_t>(parameter);
}

/// Location of one scalar entry in a system.
struct EntryLocation {
    SystemParameter parameter;
    std::size_t slice;
    std::size_t row;
    std::size_t col;
};

/// A coefficient matrix, possibly time-varying. `tau[t]` is the 0-based slice
/// used in period t; an empty `tau` means a single time-invariant slice.
template <typename Scalar>
struct ParameterMatrix {
    using Slice = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>;

    std::vector<Slice> slices;
    std::vector<std::size_t> tau;

    ParameterMatrix() = default;

    ParameterMatrix(Slice slice) : slices{std::move(slice)} {}  // NOLINT(google-explicit-constructor)

    ParameterMatrix(std::vector<Slice> slice_stack, std::vector<std::size_t> period_tau)
        : slices(std::move(slice_stack)), tau(std::move(period_tau)) {}

    [[nodiscard]] bool empty() const noexcept { return slices.empty(); }

    [[nodiscard]] bool time_varying() const noexcept { return !tau.empty(); }

    [[nodiscard]] std::size_t slice_count() const noexcept { return slices.size(); }

    [[nodiscard]] std::size_t rows() const noexcept {
        return slices.empty() ? 0 : static_cast<std::size_t>(slices.front().rows());
    }

    [[nodiscard]] std::size_t cols() const noexcept {
        return slices.empty() ? 0 : static_cast<std::size_t>(slices.front().cols());
    }

    [[nodiscard]] std::size_t entry_count() const noexcept { return slices.size() * rows() * cols(); }

    [[nodiscard]] const Slice& at_period(std::size_t period) const {
        if (!time_varying()) {
            return slices.front();
        }
        return slices.at(tau.at(period));
    }

    /// Same shape and period selector, every entry set to `value`.
    template <typename Other>
    [[nodiscard]] ParameterMatrix<Other> filled(Other value) const {
        ParameterMatrix<Other> result;
        result.tau = tau;
        result.slices.reserve(slices.size());
        for (const auto& slice : slices) {
            result.slices.push_back(ParameterMatrix<Other>::Slice::Constant(slice.rows(), slice.cols(), value));
        }
        return result;
    }

    template <typename Other>
    [[nodiscard]] bool same_shape(const ParameterMatrix<Other>& other) const noexcept {
        return slices.size() == other.slices.size() && rows() == other.rows() && cols() == other.cols() &&
               tau == other.tau;
    }
};

/// Linear-Gaussian state-space system
///   y_t     = Z_t a_t + d_t + beta_t x_t + e_t,       e_t ~ N(0, H_t)
///   a_{t+1} = T_t a_t + c_t + gamma_t w_t + R_t u_t,  u_t ~ N(0, Q_t)
/// with optional initial moments a0, P0. Instantiated on double for
/// coefficients and on int for the index structures of a ThetaMap.
template <typename Scalar>
class BasicStateSpace {
public:
    using Matrix = ParameterMatrix<Scalar>;
    using Slice = typename Matrix::Slice;

    BasicStateSpace() = default;

    /// d, c default to zero, beta and gamma to no exogenous series, and R to
    /// the m x g identity selector.
    BasicStateSpace(Matrix Z, Matrix H, Matrix T, Matrix Q) {
        const auto p = static_cast<Eigen::Index>(Z.rows());
        const auto m = static_cast<Eigen::Index>(T.rows());
        const auto g = static_cast<Eigen::Index>(Q.rows());
        at(SystemParameter::Z) = std::move(Z);
        at(SystemParameter::H) = std::move(H);
        at(SystemParameter::T) = std::move(T);
        at(SystemParameter::Q) = std::move(Q);
        at(SystemParameter::d) = Matrix(Slice::Zero(p, 1));
        at(SystemParameter::beta) = Matrix(Slice::Zero(p, 0));
        at(SystemParameter::c) = Matrix(Slice::Zero(m, 1));
        at(SystemParameter::gamma) = Matrix(Slice::Zero(m, 0));
        at(SystemParameter::R) = Matrix(Slice::Identity(m, g));
        validate();
    }

    [[nodiscard]] const Matrix& operator[](SystemParameter parameter) const noexcept {
        return matrices_[parameter_position(parameter)];
    }

    [[nodiscard]] std::size_t p() const noexcept { return (*this)[SystemParameter::Z].rows(); }

    [[nodiscard]] std::size_t m() const noexcept { return (*this)[SystemParameter::T].rows(); }

    [[nodiscard]] std::size_t g() const noexcept { return (*this)[SystemParameter::Q].rows(); }

    [[nodiscard]] std::size_t k() const noexcept { return (*this)[SystemParameter::beta].cols(); }

    [[nodiscard]] std::size_t l() const noexcept { return (*this)[SystemParameter::gamma].cols(); }

    [[nodiscard]] bool has_a0() const noexcept { return !(*this)[SystemParameter::a0].empty(); }

    [[nodiscard]] bool has_P0() const noexcept { return !(*this)[SystemParameter::P0].empty(); }

    [[nodiscard]] bool has(SystemParameter parameter) const noexcept { return !(*this)[parameter].empty(); }

    [[nodiscard]] bool time_invariant() const noexcept {
        for (const auto& matrix : matrices_) {
            if (matrix.time_varying()) {
                return false;
            }
        }
        return true;
    }

    /// Copy with one matrix replaced. An empty matrix removes a0 or P0.
    [[nodiscard]] BasicStateSpace with(SystemParameter parameter, Matrix matrix) const {
        BasicStateSpace copy = *this;
        copy.at(parameter) = std::move(matrix);
        copy.validate();
        return copy;
    }

    /// Copy with the same shapes and period selectors and every entry set to
    /// `value`; a0 and P0 are only kept if `include_initial`.
    template <typename Other>
    [[nodiscard]] BasicStateSpace<Other> filled(Other value, bool include_initial = true) const {
        BasicStateSpace<Other> result;
        for (auto parameter : kAllParameters) {
            if (is_initial_parameter(parameter) && !include_initial) {
                continue;
            }
            result.at(parameter) = (*this)[parameter].template filled<Other>(value);
        }
        return result;
    }

    /// Whether `other` has the same matrices, shapes and period selectors.
    /// a0 and P0 are compared only when requested.
    template <typename Other>
    [[nodiscard]] bool conforms(const BasicStateSpace<Other>& other, bool with_a0, bool with_P0) const {
        return first_nonconforming(other, with_a0, with_P0) == kParameterCount;
    }

    template <typename Other>
    void check_conforming(const BasicStateSpace<Other>& other, bool with_a0, bool with_P0) const {
        const std::size_t bad = first_nonconforming(other, with_a0, with_P0);
        if (bad != kParameterCount) {
            throw std::invalid_argument("system does not conform in " +
                                        std::string(parameter_name(kAllParameters[bad])));
        }
    }

    /// Entries in the canonical order Z, d, beta, H, T, c, gamma, R, Q, a0, P0;
    /// slice by slice, column-major within a slice.
    [[nodiscard]] std::vector<Scalar> vectorize(bool with_a0, bool with_P0) const {
        std::vector<Scalar> values;
        values.reserve(entry_count(with_a0, with_P0));
        for (auto parameter : kAllParameters) {
            if (!included(parameter, with_a0, with_P0)) {
                continue;
            }
            for (const auto& slice : (*this)[parameter].slices) {
                values.insert(values.end(), slice.data(), slice.data() + slice.size());
            }
        }
        return values;
    }

    /// Locations matching vectorize() element by element.
    [[nodiscard]] std::vector<EntryLocation> entry_locations(bool with_a0, bool with_P0) const {
        std::vector<EntryLocation> locations;
        locations.reserve(entry_count(with_a0, with_P0));
        for (auto parameter : kAllParameters) {
            if (!included(parameter, with_a0, with_P0)) {
                continue;
            }
            const auto& matrix = (*this)[parameter];
            for (std::size_t s = 0; s < matrix.slice_count(); ++s) {
                for (std::size_t col = 0; col < matrix.cols(); ++col) {
                    for (std::size_t row = 0; row < matrix.rows(); ++row) {
                        locations.push_back(EntryLocation{parameter, s, row, col});
                    }
                }
            }
        }
        return locations;
    }

    /// Position of `location` in vectorize().
    [[nodiscard]] std::size_t offset_of(const EntryLocation& location, bool with_a0, bool with_P0) const {
        if (!included(location.parameter, with_a0, with_P0)) {
            throw std::out_of_range("entry of " + std::string(parameter_name(location.parameter)) +
                                    " is not part of the vectorized system");
        }
        std::size_t offset = 0;
        for (auto parameter : kAllParameters) {
            if (parameter == location.parameter) {
                break;
            }
            if (included(parameter, with_a0, with_P0)) {
                offset += (*this)[parameter].entry_count();
            }
        }
        const auto& matrix = (*this)[location.parameter];
        if (location.slice >= matrix.slice_count() || location.row >= matrix.rows() || location.col >= matrix.cols()) {
            throw std::out_of_range("entry outside system matrix " + std::string(parameter_name(location.parameter)));
        }
        return offset + location.slice * matrix.rows() * matrix.cols() + location.col * matrix.rows() + location.row;
    }

    [[nodiscard]] std::size_t entry_count(bool with_a0, bool with_P0) const noexcept {
        std::size_t count = 0;
        for (auto parameter : kAllParameters) {
            if (included(parameter, with_a0, with_P0)) {
                count += (*this)[parameter].entry_count();
            }
        }
        return count;
    }

    /// Inverse of vectorize(): a system shaped like this one holding `values`.
    template <typename Other>
    [[nodiscard]] BasicStateSpace<Other> reshape(const std::vector<Other>& values, bool with_a0,
                                                 bool with_P0) const {
        if (values.size() != entry_count(with_a0, with_P0)) {
            throw std::invalid_argument("value count does not match system entries");
        }
        BasicStateSpace<Other> result;
        std::size_t offset = 0;
        for (auto parameter : kAllParameters) {
            if (!included(parameter, with_a0, with_P0)) {
                continue;
            }
            const auto& source = (*this)[parameter];
            ParameterMatrix<Other> target;
            target.tau = source.tau;
            for (const auto& slice : source.slices) {
                typename ParameterMatrix<Other>::Slice filled(slice.rows(), slice.cols());
                std::copy(values.begin() + static_cast<std::ptrdiff_t>(offset),
                          values.begin() + static_cast<std::ptrdiff_t>(offset + slice.size()), filled.data());
                offset += static_cast<std::size_t>(slice.size());
                target.slices.push_back(std::move(filled));
            }
            result.at(parameter) = std::move(target);
        }
        return result;
    }

    void validate() const {
        check_shape(SystemParameter::Z, p(), m());
        check_shape(SystemParameter::d, p(), 1);
        check_shape(SystemParameter::beta, p(), k());
        check_shape(SystemParameter::H, p(), p());
        check_shape(SystemParameter::T, m(), m());
        check_shape(SystemParameter::c, m(), 1);
        check_shape(SystemParameter::gamma, m(), l());
        check_shape(SystemParameter::R, m(), g());
        check_shape(SystemParameter::Q, g(), g());
        if (has_a0()) {
            check_shape(SystemParameter::a0, m(), 1);
        }
        if (has_P0()) {
            check_shape(SystemParameter::P0, m(), m());
        }
    }

private:
    template <typename>
    friend class BasicStateSpace;

    [[nodiscard]] Matrix& at(SystemParameter parameter) noexcept {
        return matrices_[parameter_position(parameter)];
    }

    [[nodiscard]] static bool included(SystemParameter parameter, bool with_a0, bool with_P0) noexcept {
        if (parameter == SystemParameter::a0) {
            return with_a0;
        }
        if (parameter == SystemParameter::P0) {
            return with_P0;
        }
        return true;
    }

    template <typename Other>
    [[nodiscard]] std::size_t first_nonconforming(const BasicStateSpace<Other>& other, bool with_a0,
                                                  bool with_P0) const {
        for (std::size_t i = 0; i < kParameterCount; ++i) {
            if (!included(kAllParameters[i], with_a0, with_P0)) {
                continue;
            }
            if (!matrices_[i].same_shape(other.matrices_[i])) {
                return i;
            }
        }
        return kParameterCount;
    }

    void check_shape(SystemParameter parameter, std::size_t rows, std::size_t cols) const {
        const auto& matrix = (*this)[parameter];
        const std::string name(parameter_name(parameter));
        if (matrix.empty()) {
            throw std::invalid_argument("system matrix " + name + " must have at least one slice");
        }
        for (const auto& slice : matrix.slices) {
            if (static_cast<std::size_t>(slice.rows()) != rows || static_cast<std::size_t>(slice.cols()) != cols) {
                throw std::invalid_argument("system matrix " + name + " must be " + std::to_string(rows) + "x" +
                                            std::to_string(cols));
            }
        }
        if (!matrix.time_varying() && matrix.slice_count() != 1) {
            throw std::invalid_argument("system matrix " + name + " has several slices but no period selector");
        }
        for (auto slice_index : matrix.tau) {
            if (slice_index >= matrix.slice_count()) {
                throw std::invalid_argument("period selector of " + name + " refers to a missing slice");
            }
        }
    }

    std::array<Matrix, kParameterCount> matrices_;
};

using StateSpace = BasicStateSpace<double>;
using IndexStateSpace = BasicStateSpace<int>;

extern template class BasicStateSpace<double>;
extern template class BasicStateSpace<int>;

}  // namespace libthetamap
