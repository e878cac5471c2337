#pragma once

#include "Timestamp.hpp"
#include "enums/ReservationStatus.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace inventory::domain {

/**
 * @brief Резерв остатка под будущее списание
 *
 * RELEASED и EXPIRED - терминальные статусы.
 */
struct StockReservation {
    std::string id;
    std::string tenantId;
    std::string productId;
    std::string locationId;
    int64_t quantity = 0;
    Timestamp expiresAt;
    ReservationStatus status = ReservationStatus::ACTIVE;
    std::optional<std::string> referenceType;
    std::optional<std::string> referenceId;
    std::string createdById;
    Timestamp createdAt;

    bool isActive() const { return status == ReservationStatus::ACTIVE; }
};

} // namespace inventory::domain
