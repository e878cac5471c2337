#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include "enums/TransferStatus.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inventory::domain {

/**
 * @brief Строка перемещения
 *
 * shippedUnitCost фиксируется при отгрузке и используется как есть
 * при приёмке и отмене.
 */
struct TransferItem {
    std::string id;
    std::string productId;
    int64_t requestedQuantity = 0;
    int64_t shippedQuantity = 0;
    std::optional<Money> shippedUnitCost;
    int64_t receivedQuantity = 0;
    std::optional<std::string> shortageReason;

    int64_t shortage() const { return shippedQuantity - receivedQuantity; }
};

/**
 * @brief Перемещение между складами
 *
 * DRAFT -> IN_TRANSIT -> COMPLETED
 * DRAFT | IN_TRANSIT -> CANCELLED
 */
class StockTransfer {
public:
    std::string id;
    std::string tenantId;
    std::string transferNumber;
    TransferStatus status = TransferStatus::DRAFT;
    std::string fromLocationId;
    std::string toLocationId;
    std::optional<std::string> note;
    std::string createdById;
    Timestamp createdAt;
    std::optional<Timestamp> shippedAt;
    std::optional<Timestamp> receivedAt;
    std::optional<Timestamp> cancelledAt;
    std::vector<TransferItem> items;

    int64_t totalRequestedQuantity() const {
        int64_t total = 0;
        for (const auto& item : items) {
            total += item.requestedQuantity;
        }
        return total;
    }

    void appendNote(const std::string& tag, const std::string& text) {
        std::string line = "[" + tag + "] " + text;
        note = note && !note->empty() ? *note + "\n" + line : line;
    }
};

} // namespace inventory::domain
