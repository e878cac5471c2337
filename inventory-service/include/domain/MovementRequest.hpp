#pragma once

#include "Money.hpp"
#include "enums/ReferenceType.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inventory::domain {

struct StockInItem {
    std::string productId;
    int64_t quantity = 0;
    Money unitCost;
    std::optional<std::string> batchId;
};

/**
 * @brief Приход на склад (одна или несколько позиций)
 *
 * referenceType по умолчанию PURCHASE.
 */
struct StockInRequest {
    std::string locationId;
    std::vector<StockInItem> items;
    std::optional<ReferenceType> referenceType;
    std::optional<std::string> referenceId;
    std::optional<std::string> note;
};

struct StockLine {
    std::string productId;
    int64_t quantity = 0;
};

/**
 * @brief Расход со склада, referenceType по умолчанию SALE
 */
struct StockOutRequest {
    std::string locationId;
    std::vector<StockLine> items;
    std::optional<ReferenceType> referenceType;
    std::optional<std::string> referenceId;
    std::optional<std::string> note;
};

/**
 * @brief Позиция корректировки: quantity > 0 - приход, < 0 - списание
 */
struct AdjustItem {
    std::string productId;
    int64_t quantity = 0;
    std::optional<Money> unitCost;
};

struct AdjustRequest {
    std::string locationId;
    std::vector<AdjustItem> items;
    std::string reason;
    std::optional<std::string> note;
};

} // namespace inventory::domain
