#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inventory::domain {

/**
 * @brief Слой себестоимости: партия, пришедшая одним IN-движением
 *
 * remainingQty уменьшается при списании, слой с нулевым остатком
 * сохраняется для истории оценки.
 */
struct ValuationLayer {
    std::string id;
    std::string tenantId;
    std::string productId;
    std::string locationId;
    int64_t originalQty = 0;
    int64_t remainingQty = 0;
    Money unitCost;
    std::string sourceMovementId;
    std::optional<std::string> batchId;
    Timestamp createdAt;
};

/**
 * @brief Запись аудита: сколько и по какой цене списано со слоя
 */
struct ValuationLayerConsumption {
    std::string valuationLayerId;
    std::string stockMovementId;
    int64_t quantity = 0;
    Money unitCost;
};

/**
 * @brief Списание с одного слоя в рамках consumeLayers
 */
struct LayerConsumption {
    std::string layerId;
    int64_t quantity = 0;
    Money unitCost;
    Money lineCost;
};

struct LayerConsumptionResult {
    Money totalCost;
    std::vector<LayerConsumption> consumptions;

    int64_t consumedQuantity() const {
        int64_t total = 0;
        for (const auto& c : consumptions) {
            total += c.quantity;
        }
        return total;
    }
};

} // namespace inventory::domain
