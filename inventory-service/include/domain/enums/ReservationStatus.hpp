#pragma once

#include <stdexcept>
#include <string>

namespace inventory::domain {

enum class ReservationStatus {
    ACTIVE,
    RELEASED,
    EXPIRED
};

inline std::string toString(ReservationStatus status) {
    switch (status) {
        case ReservationStatus::ACTIVE: return "ACTIVE";
        case ReservationStatus::RELEASED: return "RELEASED";
        case ReservationStatus::EXPIRED: return "EXPIRED";
        default: return "UNKNOWN";
    }
}

inline ReservationStatus parseReservationStatus(const std::string& str) {
    if (str == "ACTIVE") return ReservationStatus::ACTIVE;
    if (str == "RELEASED") return ReservationStatus::RELEASED;
    if (str == "EXPIRED") return ReservationStatus::EXPIRED;
    throw std::invalid_argument("Unknown reservation status: " + str);
}

} // namespace inventory::domain
