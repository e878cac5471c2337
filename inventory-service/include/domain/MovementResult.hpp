#pragma once

#include "Money.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace inventory::domain {

struct StockInResult {
    std::vector<std::string> movementIds;
    int64_t totalQuantity = 0;
};

struct StockOutResult {
    std::vector<std::string> movementIds;
    int64_t totalQuantity = 0;
    Money totalCost;
};

struct AdjustResult {
    std::vector<std::string> movementIds;
    int positiveAdjustments = 0;
    int negativeAdjustments = 0;
};

} // namespace inventory::domain
