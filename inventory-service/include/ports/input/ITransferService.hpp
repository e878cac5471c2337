#pragma once

#include "domain/StockTransfer.hpp"
#include "domain/TransferRequest.hpp"
#include <optional>
#include <string>

namespace inventory::ports::input {

class ITransferService {
public:
    virtual ~ITransferService() = default;

    virtual domain::CreateTransferResult create(
        const std::string& tenantId, const std::string& userId,
        const domain::CreateTransferRequest& request) = 0;

    virtual domain::StockTransfer ship(
        const std::string& tenantId, const std::string& userId,
        const std::string& transferId, const std::optional<std::string>& note = std::nullopt) = 0;

    virtual domain::StockTransfer receive(
        const std::string& tenantId, const std::string& userId,
        const std::string& transferId, const domain::ReceiveTransferRequest& request) = 0;

    virtual domain::StockTransfer cancel(
        const std::string& tenantId, const std::string& userId, const std::string& transferId) = 0;

    virtual domain::StockTransfer findOne(const std::string& tenantId, const std::string& transferId) = 0;
};

} // namespace inventory::ports::input
