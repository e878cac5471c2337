#pragma once

#include <stdexcept>
#include <string>

namespace inventory::domain {

enum class TransferStatus {
    DRAFT,
    IN_TRANSIT,
    COMPLETED,
    CANCELLED
};

inline std::string toString(TransferStatus status) {
    switch (status) {
        case TransferStatus::DRAFT: return "DRAFT";
        case TransferStatus::IN_TRANSIT: return "IN_TRANSIT";
        case TransferStatus::COMPLETED: return "COMPLETED";
        case TransferStatus::CANCELLED: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

inline TransferStatus parseTransferStatus(const std::string& str) {
    if (str == "DRAFT") return TransferStatus::DRAFT;
    if (str == "IN_TRANSIT") return TransferStatus::IN_TRANSIT;
    if (str == "COMPLETED") return TransferStatus::COMPLETED;
    if (str == "CANCELLED") return TransferStatus::CANCELLED;
    throw std::invalid_argument("Unknown transfer status: " + str);
}

} // namespace inventory::domain
