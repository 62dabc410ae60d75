#include "libthetamap/psi_definition.hpp"

#include <algorithm>
#include <stdexcept>

namespace libthetamap {

PsiDefinition PsiDefinition::identity(std::size_t theta_index) {
    PsiDefinition definition;
    definition.theta_indexes = {theta_index};
    definition.evaluate = [](const std::vector<double>& arguments) { return arguments.front(); };
    definition.inverse = [](double psi) { return psi; };
    return definition;
}

double PsiDefinition::operator()(const std::vector<double>& theta) const {
    if (!evaluate) {
        throw std::logic_error("psi definition has no evaluator");
    }
    std::vector<double> arguments(theta_indexes.size());
    for (std::size_t i = 0; i < theta_indexes.size(); ++i) {
        if (theta_indexes[i] >= theta.size()) {
            throw std::out_of_range("psi definition reads theta beyond its length");
        }
        arguments[i] = theta[theta_indexes[i]];
    }
    return evaluate(arguments);
}

bool PsiDefinition::reads(std::size_t theta_index) const noexcept {
    return std::find(theta_indexes.begin(), theta_indexes.end(), theta_index) != theta_indexes.end();
}

}  // namespace libthetamap
