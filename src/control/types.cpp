#include "types.hpp"
#include "errors.hpp"

namespace evasion_control {
namespace utils {

ObjectiveKind parseObjectiveKind(const std::string& name) {
    if (name == "fuel") {
        return ObjectiveKind::FUEL;
    }
    if (name == "min_distance") {
        return ObjectiveKind::MIN_DISTANCE;
    }
    if (name == "next_distance") {
        return ObjectiveKind::NEXT_DISTANCE;
    }
    throw InvalidArgument("Unknown objective: '" + name + "'");
}

std::string objectiveName(ObjectiveKind kind) {
    switch (kind) {
        case ObjectiveKind::FUEL: return "fuel";
        case ObjectiveKind::MIN_DISTANCE: return "min_distance";
        case ObjectiveKind::NEXT_DISTANCE: return "next_distance";
        default: return "unknown";
    }
}

} // namespace utils
} // namespace evasion_control
