#pragma once

#include "Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace inventory::domain {

struct CreateReservationRequest {
    std::string productId;
    std::string locationId;
    int64_t quantity = 0;
    Timestamp expiresAt;
    std::optional<std::string> referenceType;
    std::optional<std::string> referenceId;
};

/**
 * @brief Частичное обновление резерва, нужно хотя бы одно поле
 */
struct UpdateReservationRequest {
    std::optional<int64_t> quantity;
    std::optional<Timestamp> expiresAt;
    std::optional<std::string> referenceType;
    std::optional<std::string> referenceId;

    bool empty() const {
        return !quantity && !expiresAt && !referenceType && !referenceId;
    }
};

} // namespace inventory::domain
