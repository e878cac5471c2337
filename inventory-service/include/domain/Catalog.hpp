#pragma once

#include "enums/PricingMethod.hpp"
#include "enums/ProductType.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace inventory::domain {

/**
 * @brief Товар каталога (только то, что нужно складскому ядру)
 */
struct Product {
    std::string id;
    std::string tenantId;
    std::string name;
    std::string sku;
    ProductType productType = ProductType::SIMPLE;
    std::optional<PricingMethod> pricingMethod;
    int64_t reorderLevel = 0;   ///< 0 - уровень дозаказа не задан
    bool deleted = false;
};

/**
 * @brief Склад / точка хранения
 */
struct Location {
    std::string id;
    std::string tenantId;
    std::string name;
    std::optional<std::string> code;
    bool active = true;
};

} // namespace inventory::domain
