#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include "ValuationLayer.hpp"
#include "enums/MovementType.hpp"
#include "enums/PricingMethod.hpp"
#include "enums/ReferenceType.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inventory::domain {

/**
 * @brief Запись складского журнала
 *
 * Неизменяемая после создания. totalCost = unitCost * quantity
 * (для OUT - сумма стоимостей списанных слоёв).
 */
struct StockMovement {
    std::string id;
    std::string tenantId;
    std::string productId;
    std::string locationId;
    MovementType movementType = MovementType::IN;
    int64_t quantity = 0;
    Money unitCost;
    Money totalCost;
    ReferenceType referenceType = ReferenceType::PURCHASE;
    std::optional<std::string> referenceId;
    std::optional<std::string> note;
    std::optional<PricingMethod> costingMethod;
    std::optional<std::string> transferId;
    std::string createdById;
    Timestamp createdAt;
};

/**
 * @brief Движение вместе со списаниями слоёв (для OUT)
 */
struct MovementDetail {
    StockMovement movement;
    std::vector<ValuationLayerConsumption> consumptions;
};

} // namespace inventory::domain
