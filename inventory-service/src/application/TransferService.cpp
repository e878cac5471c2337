#include "application/TransferService.hpp"
#include "application/LockOrder.hpp"
#include "domain/exceptions/InventoryException.hpp"
#include "utils/UuidGenerator.hpp"

#include <iomanip>
#include <iostream>
#include <map>
#include <set>
#include <sstream>
#include <utility>

namespace inventory::application {

using domain::ReferenceType;
using domain::StockTransfer;
using domain::TransferStatus;
using ports::output::IUnitOfWork;

namespace {

std::string productName(IUnitOfWork& uow, const std::string& tenantId, const std::string& productId) {
    auto product = uow.catalog().findProduct(tenantId, productId);
    return product ? product->name : productId;
}

} // namespace

TransferService::TransferService(
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory,
    std::shared_ptr<StockValidator> validator,
    std::shared_ptr<ValuationEngine> valuation,
    std::shared_ptr<MovementService> movements
) : uowFactory_(std::move(uowFactory))
  , validator_(std::move(validator))
  , valuation_(std::move(valuation))
  , movements_(std::move(movements))
{
    std::cout << "[TransferService] Created" << std::endl;
}

std::string TransferService::formatTransferNumber(int year, int64_t sequence) {
    std::ostringstream ss;
    ss << "TRF-" << year << "-" << std::setw(4) << std::setfill('0') << sequence;
    return ss.str();
}

domain::CreateTransferResult TransferService::create(
    const std::string& tenantId, const std::string& userId,
    const domain::CreateTransferRequest& request)
{
    if (request.fromLocationId == request.toLocationId) {
        throw domain::BadRequestException("Source and destination locations must be different");
    }
    if (request.items.empty()) {
        throw domain::BadRequestException("Transfer requires at least one item");
    }

    std::vector<std::string> productIds;
    std::set<std::string> seen;
    for (const auto& line : request.items) {
        if (line.requestedQuantity <= 0) {
            throw domain::BadRequestException(
                "Requested quantity must be positive for product " + line.productId);
        }
        // Приёмка сопоставляет строки по товару, поэтому товар в перемещении один раз
        if (!seen.insert(line.productId).second) {
            throw domain::BadRequestException(
                "Product " + line.productId + " is listed more than once in the transfer");
        }
        productIds.push_back(line.productId);
    }

    auto uow = uowFactory_->begin();
    validator_->validateProducts(*uow, tenantId, productIds);
    validator_->validateLocations(*uow, tenantId, {request.fromLocationId, request.toLocationId});

    StockTransfer transfer;
    transfer.id = utils::UuidGenerator::generate();
    transfer.tenantId = tenantId;
    transfer.createdAt = domain::Timestamp::now();
    int year = transfer.createdAt.year();
    transfer.transferNumber = formatTransferNumber(year, uow->transfers().nextSequence(tenantId, year));
    transfer.status = TransferStatus::DRAFT;
    transfer.fromLocationId = request.fromLocationId;
    transfer.toLocationId = request.toLocationId;
    transfer.note = request.note;
    transfer.createdById = userId;

    for (const auto& line : request.items) {
        domain::TransferItem item;
        item.id = utils::UuidGenerator::generate();
        item.productId = line.productId;
        item.requestedQuantity = line.requestedQuantity;
        transfer.items.push_back(item);
    }

    uow->transfers().insert(transfer);

    if (request.shipImmediately) {
        shipInTransaction(*uow, transfer, userId, std::nullopt);
    }

    uow->commit();

    std::cout << "[TransferService] Created " << transfer.transferNumber << " ("
              << transfer.items.size() << " item(s), " << request.fromLocationId
              << " -> " << request.toLocationId << ")"
              << (request.shipImmediately ? ", shipped" : "") << std::endl;

    return {transfer.id, transfer.transferNumber};
}

domain::StockTransfer TransferService::ship(
    const std::string& tenantId, const std::string& userId,
    const std::string& transferId, const std::optional<std::string>& note)
{
    auto uow = uowFactory_->begin();
    auto transfer = lockTransfer(*uow, tenantId, transferId);

    if (transfer.status != TransferStatus::DRAFT) {
        throw domain::ConflictException(
            "Only DRAFT transfers can be shipped, " + transfer.transferNumber +
            " is " + domain::toString(transfer.status));
    }

    shipInTransaction(*uow, transfer, userId, note);
    uow->commit();
    return transfer;
}

void TransferService::shipInTransaction(IUnitOfWork& uow, StockTransfer& transfer,
                                        const std::string& userId, const std::optional<std::string>& note)
{
    validator_->validateLocation(uow, transfer.tenantId, transfer.fromLocationId);

    std::vector<domain::StockLine> lines;
    for (const auto& item : transfer.items) {
        lines.push_back({item.productId, item.requestedQuantity});
    }
    validator_->validateStockAvailability(uow, transfer.tenantId, transfer.fromLocationId, lines);

    MovementContext context{transfer.tenantId, userId, transfer.fromLocationId,
                            ReferenceType::TRANSFER, transfer.transferNumber,
                            "Transfer to " + transfer.toLocationId, transfer.id};

    for (auto index : indicesByProduct(transfer.items)) {
        auto& item = transfer.items[index];
        auto wac = valuation_->calculateWAC(uow, item.productId, transfer.fromLocationId, transfer.tenantId);
        movements_->recordOutbound(uow, context, item.productId, item.requestedQuantity, wac);

        item.shippedQuantity = item.requestedQuantity;
        item.shippedUnitCost = wac;
    }

    transfer.status = TransferStatus::IN_TRANSIT;
    transfer.shippedAt = domain::Timestamp::now();
    if (note && !note->empty()) {
        transfer.appendNote("Ship", *note);
    }
    uow.transfers().update(transfer);

    std::cout << "[TransferService] Shipped " << transfer.transferNumber << ": "
              << transfer.totalRequestedQuantity() << " unit(s) from "
              << transfer.fromLocationId << std::endl;
}

domain::StockTransfer TransferService::receive(
    const std::string& tenantId, const std::string& userId,
    const std::string& transferId, const domain::ReceiveTransferRequest& request)
{
    auto uow = uowFactory_->begin();
    auto transfer = lockTransfer(*uow, tenantId, transferId);

    if (transfer.status != TransferStatus::IN_TRANSIT) {
        throw domain::ConflictException(
            "Only IN_TRANSIT transfers can be received, " + transfer.transferNumber +
            " is " + domain::toString(transfer.status));
    }

    std::map<std::string, const domain::ReceiveLine*> lines;
    for (const auto& line : request.items) {
        if (!lines.emplace(line.productId, &line).second) {
            throw domain::BadRequestException(
                "Product " + line.productId + " is listed more than once in the receipt");
        }
    }
    for (const auto& line : request.items) {
        bool known = false;
        for (const auto& item : transfer.items) {
            if (item.productId == line.productId) {
                known = true;
                break;
            }
        }
        if (!known) {
            throw domain::BadRequestException(
                "Product " + line.productId + " is not part of transfer " + transfer.transferNumber);
        }
    }

    // Сначала проверяем все строки, потом двигаем остатки
    for (const auto& item : transfer.items) {
        auto it = lines.find(item.productId);
        if (it == lines.end()) {
            throw domain::BadRequestException(
                "Received quantity is missing for \"" + productName(*uow, tenantId, item.productId) + "\"");
        }
        const auto& line = *it->second;
        if (line.receivedQuantity < 0) {
            throw domain::BadRequestException(
                "Received quantity must not be negative for \"" +
                productName(*uow, tenantId, item.productId) + "\"");
        }
        if (line.receivedQuantity > item.shippedQuantity) {
            std::ostringstream msg;
            msg << "Received quantity exceeds shipped for \"" << productName(*uow, tenantId, item.productId)
                << "\". Shipped: " << item.shippedQuantity << ", Received: " << line.receivedQuantity;
            throw domain::BadRequestException(msg.str());
        }
        int64_t shortage = item.shippedQuantity - line.receivedQuantity;
        if (shortage > 0 && (!line.shortageReason || line.shortageReason->empty())) {
            std::ostringstream msg;
            msg << "Shortage reason is required for \"" << productName(*uow, tenantId, item.productId)
                << "\". Shipped: " << item.shippedQuantity << ", Received: " << line.receivedQuantity
                << ", Shortage: " << shortage;
            throw domain::BadRequestException(msg.str());
        }
    }

    validator_->validateLocation(*uow, tenantId, transfer.toLocationId);

    MovementContext context{tenantId, userId, transfer.toLocationId,
                            ReferenceType::TRANSFER, transfer.transferNumber,
                            "Transfer from " + transfer.fromLocationId, transfer.id};

    for (auto index : indicesByProduct(transfer.items)) {
        auto& item = transfer.items[index];
        const auto& line = *lines[item.productId];
        item.receivedQuantity = line.receivedQuantity;

        if (item.shortage() > 0) {
            item.shortageReason = line.shortageReason;
            std::cerr << "[TransferService] WARNING: " << transfer.transferNumber << " shortage of "
                      << item.shortage() << " unit(s) for product " << item.productId
                      << " (" << *line.shortageReason << ")" << std::endl;
        }

        if (line.receivedQuantity > 0) {
            movements_->recordInbound(*uow, context, item.productId, line.receivedQuantity,
                                      item.shippedUnitCost.value_or(domain::Money::zero()));
        }
    }

    transfer.status = TransferStatus::COMPLETED;
    transfer.receivedAt = domain::Timestamp::now();
    if (request.note && !request.note->empty()) {
        transfer.appendNote("Receive", *request.note);
    }
    uow->transfers().update(transfer);
    uow->commit();

    std::cout << "[TransferService] Received " << transfer.transferNumber << " at "
              << transfer.toLocationId << std::endl;
    return transfer;
}

domain::StockTransfer TransferService::cancel(
    const std::string& tenantId, const std::string& userId, const std::string& transferId)
{
    auto uow = uowFactory_->begin();
    auto transfer = lockTransfer(*uow, tenantId, transferId);

    if (transfer.status != TransferStatus::DRAFT && transfer.status != TransferStatus::IN_TRANSIT) {
        throw domain::ConflictException(
            "Cannot cancel transfer " + transfer.transferNumber + " in status " +
            domain::toString(transfer.status));
    }

    bool reversed = transfer.status == TransferStatus::IN_TRANSIT;
    if (reversed) {
        MovementContext context{tenantId, userId, transfer.fromLocationId,
                                ReferenceType::ADJUSTMENT, "CANCEL-" + transfer.transferNumber,
                                std::string("Transfer cancellation reversal"), transfer.id};

        for (auto index : indicesByProduct(transfer.items)) {
            const auto& item = transfer.items[index];
            if (item.shippedQuantity > 0) {
                movements_->recordInbound(*uow, context, item.productId, item.shippedQuantity,
                                          item.shippedUnitCost.value_or(domain::Money::zero()));
            }
        }
    }

    transfer.status = TransferStatus::CANCELLED;
    transfer.cancelledAt = domain::Timestamp::now();
    uow->transfers().update(transfer);
    uow->commit();

    std::cout << "[TransferService] Cancelled " << transfer.transferNumber
              << (reversed ? " (shipment reversed)" : "") << std::endl;
    return transfer;
}

domain::StockTransfer TransferService::findOne(const std::string& tenantId, const std::string& transferId) {
    auto uow = uowFactory_->begin();
    auto transfer = uow->transfers().findById(tenantId, transferId);
    if (!transfer) {
        throw domain::NotFoundException("Transfer not found: " + transferId);
    }
    return *transfer;
}

StockTransfer TransferService::lockTransfer(IUnitOfWork& uow,
                                            const std::string& tenantId, const std::string& transferId)
{
    auto transfer = uow.transfers().findForUpdate(tenantId, transferId);
    if (!transfer) {
        throw domain::NotFoundException("Transfer not found: " + transferId);
    }
    return *transfer;
}

} // namespace inventory::application
