#pragma once

#include <stdexcept>
#include <string>

namespace inventory::domain {

/**
 * @brief Тип товара в каталоге
 *
 * VARIABLE - родительский SKU, остатки на нём не ведутся.
 */
enum class ProductType {
    SIMPLE,
    VARIANT,
    VARIABLE
};

inline std::string toString(ProductType type) {
    switch (type) {
        case ProductType::SIMPLE: return "SIMPLE";
        case ProductType::VARIANT: return "VARIANT";
        case ProductType::VARIABLE: return "VARIABLE";
        default: return "UNKNOWN";
    }
}

inline ProductType parseProductType(const std::string& str) {
    if (str == "SIMPLE") return ProductType::SIMPLE;
    if (str == "VARIANT") return ProductType::VARIANT;
    if (str == "VARIABLE") return ProductType::VARIABLE;
    throw std::invalid_argument("Unknown product type: " + str);
}

} // namespace inventory::domain
