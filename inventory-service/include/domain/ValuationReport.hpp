#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace inventory::domain {

struct ValuationLayerLine {
    std::string layerId;
    Money unitCost;
    int64_t remainingQty = 0;
    Money value;
    Timestamp createdAt;
};

struct ValuationLine {
    std::string productId;
    std::string locationId;
    int64_t totalQuantity = 0;
    Money totalValue;
    Money averageCost;
    std::vector<ValuationLayerLine> layers;
};

/**
 * @brief Оценка склада тенанта по открытым слоям
 */
struct ValuationReport {
    int64_t totalUnits = 0;
    Money totalValue;
    std::vector<ValuationLine> items;
};

} // namespace inventory::domain
