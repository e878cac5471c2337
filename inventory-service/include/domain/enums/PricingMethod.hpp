#pragma once

#include <stdexcept>
#include <string>

namespace inventory::domain {

/**
 * @brief Метод списания себестоимости
 *
 * FIFO - сначала старые слои, LIFO - сначала новые,
 * MOVING_AVERAGE - средневзвешенная цена на момент списания.
 */
enum class PricingMethod {
    FIFO,
    LIFO,
    MOVING_AVERAGE
};

inline std::string toString(PricingMethod method) {
    switch (method) {
        case PricingMethod::FIFO: return "FIFO";
        case PricingMethod::LIFO: return "LIFO";
        case PricingMethod::MOVING_AVERAGE: return "MOVING_AVERAGE";
        default: return "UNKNOWN";
    }
}

inline PricingMethod parsePricingMethod(const std::string& str) {
    if (str == "FIFO") return PricingMethod::FIFO;
    if (str == "LIFO") return PricingMethod::LIFO;
    if (str == "MOVING_AVERAGE") return PricingMethod::MOVING_AVERAGE;
    throw std::invalid_argument("Unknown pricing method: " + str);
}

} // namespace inventory::domain
