#pragma once

#include <stdexcept>
#include <string>

namespace inventory::domain {

enum class MovementType {
    IN,
    OUT
};

inline std::string toString(MovementType type) {
    switch (type) {
        case MovementType::IN: return "IN";
        case MovementType::OUT: return "OUT";
        default: return "UNKNOWN";
    }
}

inline MovementType parseMovementType(const std::string& str) {
    if (str == "IN") return MovementType::IN;
    if (str == "OUT") return MovementType::OUT;
    throw std::invalid_argument("Unknown movement type: " + str);
}

} // namespace inventory::domain
