#pragma once

#include <cstdint>
#include <string>

namespace inventory::domain {

/**
 * @brief Остаток товара на складе
 *
 * Одна строка на (tenantId, productId, locationId). Меняется только
 * атомарным инкрементом, никогда не удаляется.
 */
struct Balance {
    std::string tenantId;
    std::string productId;
    std::string locationId;
    int64_t onHandQuantity = 0;
    int64_t reservedQuantity = 0;

    int64_t available() const { return onHandQuantity - reservedQuantity; }
};

} // namespace inventory::domain
