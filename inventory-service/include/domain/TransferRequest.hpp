#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inventory::domain {

struct TransferLine {
    std::string productId;
    int64_t requestedQuantity = 0;
};

/**
 * @brief Создание перемещения
 *
 * shipImmediately = true - сразу отгрузить в той же транзакции.
 */
struct CreateTransferRequest {
    std::string fromLocationId;
    std::string toLocationId;
    std::vector<TransferLine> items;
    std::optional<std::string> note;
    bool shipImmediately = false;
};

struct ReceiveLine {
    std::string productId;
    int64_t receivedQuantity = 0;
    std::optional<std::string> shortageReason;
};

struct ReceiveTransferRequest {
    std::vector<ReceiveLine> items;
    std::optional<std::string> note;
};

struct CreateTransferResult {
    std::string transferId;
    std::string transferNumber;
};

} // namespace inventory::domain
