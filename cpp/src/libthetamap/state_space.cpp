#include "libthetamap/state_space.hpp"

namespace libthetamap {

std::string_view parameter_name(SystemParameter parameter) noexcept {
    switch (parameter) {
        case SystemParameter::Z:
            return "Z";
        case SystemParameter::d:
            return "d";
        case SystemParameter::beta:
            return "beta";
        case SystemParameter::H:
            return "H";
        case SystemParameter::T:
            return "T";
        case SystemParameter::c:
            return "c";
        case SystemParameter::gamma:
            return "gamma";
        case SystemParameter::R:
            return "R";
        case SystemParameter::Q:
            return "Q";
        case SystemParameter::a0:
            return "a0";
        case SystemParameter::P0:
            return "P0";
    }
    return "";
}

bool is_symmetric_parameter(SystemParameter parameter) noexcept {
    return parameter == SystemParameter::H || parameter == SystemParameter::Q || parameter == SystemParameter::P0;
}

bool is_initial_parameter(SystemParameter parameter) noexcept {
    return parameter == SystemParameter::a0 || parameter == SystemParameter::P0;
}

template class BasicStateSpace<double>;
template class BasicStateSpace<int>;

}  // namespace libthetamap
