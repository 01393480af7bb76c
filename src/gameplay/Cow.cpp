#include "ditch/gameplay/Cow.hpp"

namespace ditch::gameplay {

std::string_view ToString(CowState state) {
    switch (state) {
        case CowState::Wandering: return "Wandering";
        case CowState::Drowning:  return "Drowning";
        case CowState::Rescued:   return "Rescued";
        case CowState::Dead:      return "Dead";
        case CowState::Safe:      return "Safe";
    }
    return "Unknown";
}

} // namespace ditch::gameplay
