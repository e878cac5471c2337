#pragma once

#include <stdexcept>
#include <string>

namespace inventory::domain {

/**
 * @brief Источник движения по складу
 */
enum class ReferenceType {
    PURCHASE,
    SALE,
    RETURN,
    ADJUSTMENT,
    TRANSFER
};

inline std::string toString(ReferenceType type) {
    switch (type) {
        case ReferenceType::PURCHASE: return "PURCHASE";
        case ReferenceType::SALE: return "SALE";
        case ReferenceType::RETURN: return "RETURN";
        case ReferenceType::ADJUSTMENT: return "ADJUSTMENT";
        case ReferenceType::TRANSFER: return "TRANSFER";
        default: return "UNKNOWN";
    }
}

inline ReferenceType parseReferenceType(const std::string& str) {
    if (str == "PURCHASE") return ReferenceType::PURCHASE;
    if (str == "SALE") return ReferenceType::SALE;
    if (str == "RETURN") return ReferenceType::RETURN;
    if (str == "ADJUSTMENT") return ReferenceType::ADJUSTMENT;
    if (str == "TRANSFER") return ReferenceType::TRANSFER;
    throw std::invalid_argument("Unknown reference type: " + str);
}

} // namespace inventory::domain
