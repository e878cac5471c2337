#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace inventory::domain {

struct LocationBalanceLine {
    std::string locationId;
    std::string locationName;
    int64_t onHandQuantity = 0;
    int64_t reservedQuantity = 0;
    int64_t availableQuantity = 0;
};

/**
 * @brief Остатки одного товара по всем складам
 */
struct ProductBalanceSummary {
    std::string productId;
    std::string productName;
    std::string productSku;
    int64_t totalOnHand = 0;
    int64_t totalReserved = 0;
    int64_t totalAvailable = 0;
    std::vector<LocationBalanceLine> locations;
};

struct ProductBalanceLine {
    std::string productId;
    std::string productName;
    std::string productSku;
    int64_t onHandQuantity = 0;
    int64_t reservedQuantity = 0;
    int64_t availableQuantity = 0;
};

/**
 * @brief Остатки всех товаров на одном складе
 */
struct LocationBalanceSummary {
    std::string locationId;
    std::string locationName;
    std::string locationCode;
    int64_t totalUnits = 0;
    size_t productCount = 0;
    std::vector<ProductBalanceLine> products;
};

/**
 * @brief Строка отчёта о нехватке: onHand ниже уровня дозаказа товара
 */
struct LowStockLine {
    std::string productId;
    std::string productName;
    std::string productSku;
    std::string locationId;
    std::string locationName;
    int64_t onHandQuantity = 0;
    int64_t reorderLevel = 0;
    int64_t shortage = 0;
};

} // namespace inventory::domain
