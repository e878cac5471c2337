#include "application/MovementService.hpp"
#include "application/LockOrder.hpp"
#include "domain/exceptions/InventoryException.hpp"
#include "utils/UuidGenerator.hpp"

#include <cstdlib>
#include <iostream>
#include <utility>

namespace inventory::application {

using domain::Money;
using domain::MovementType;
using domain::ReferenceType;
using ports::output::IUnitOfWork;

MovementService::MovementService(
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory,
    std::shared_ptr<StockValidator> validator,
    std::shared_ptr<ValuationEngine> valuation,
    std::shared_ptr<BalanceTracker> balances
) : uowFactory_(std::move(uowFactory))
  , validator_(std::move(validator))
  , valuation_(std::move(valuation))
  , balances_(std::move(balances))
{
    std::cout << "[MovementService] Created" << std::endl;
}

void MovementService::requirePositive(const std::string& productId, int64_t quantity) {
    if (quantity <= 0) {
        throw domain::BadRequestException(
            "Quantity must be positive for product " + productId + ", got " + std::to_string(quantity));
    }
}

domain::StockInResult MovementService::stockIn(
    const std::string& tenantId, const std::string& userId,
    const domain::StockInRequest& request)
{
    if (request.items.empty()) {
        throw domain::BadRequestException("Stock in requires at least one item");
    }

    std::vector<std::string> productIds;
    for (const auto& item : request.items) {
        requirePositive(item.productId, item.quantity);
        if (item.unitCost.isNegative()) {
            throw domain::BadRequestException("Unit cost must not be negative for product " + item.productId);
        }
        productIds.push_back(item.productId);
    }

    auto uow = uowFactory_->begin();
    validator_->validateProducts(*uow, tenantId, productIds);
    validator_->validateLocation(*uow, tenantId, request.locationId);

    MovementContext context{tenantId, userId, request.locationId,
                            request.referenceType.value_or(ReferenceType::PURCHASE),
                            request.referenceId, request.note, std::nullopt};

    // Позиции независимы, но одна транзакция pqxx не допускает параллельных запросов
    domain::StockInResult result;
    result.movementIds.resize(request.items.size());
    for (auto index : indicesByProduct(request.items)) {
        const auto& item = request.items[index];
        auto movement = recordInbound(*uow, context, item.productId, item.quantity, item.unitCost, item.batchId);
        result.movementIds[index] = movement.id;
        result.totalQuantity += item.quantity;
    }

    uow->commit();

    std::cout << "[MovementService] Stock in: " << request.items.size() << " item(s), "
              << result.totalQuantity << " unit(s) at " << request.locationId << std::endl;
    return result;
}

domain::StockOutResult MovementService::stockOut(
    const std::string& tenantId, const std::string& userId,
    const domain::StockOutRequest& request)
{
    if (request.items.empty()) {
        throw domain::BadRequestException("Stock out requires at least one item");
    }

    std::vector<std::string> productIds;
    for (const auto& item : request.items) {
        requirePositive(item.productId, item.quantity);
        productIds.push_back(item.productId);
    }

    auto uow = uowFactory_->begin();
    validator_->validateProducts(*uow, tenantId, productIds);
    validator_->validateLocation(*uow, tenantId, request.locationId);
    validator_->validateStockAvailability(*uow, tenantId, request.locationId, request.items);

    MovementContext context{tenantId, userId, request.locationId,
                            request.referenceType.value_or(ReferenceType::SALE),
                            request.referenceId, request.note, std::nullopt};

    // Строго последовательно: одинаковые товары делят слои
    domain::StockOutResult result;
    for (const auto& item : request.items) {
        auto record = recordOutbound(*uow, context, item.productId, item.quantity);
        result.movementIds.push_back(record.movement.id);
        result.totalQuantity += item.quantity;
        result.totalCost += record.movement.totalCost;
    }

    uow->commit();

    std::cout << "[MovementService] Stock out: " << request.items.size() << " item(s), total cost "
              << result.totalCost << std::endl;
    return result;
}

domain::AdjustResult MovementService::adjust(
    const std::string& tenantId, const std::string& userId,
    const domain::AdjustRequest& request)
{
    if (request.items.empty()) {
        throw domain::BadRequestException("Adjustment requires at least one item");
    }
    if (request.reason.empty()) {
        throw domain::BadRequestException("Adjustment reason is required");
    }

    std::vector<std::string> productIds;
    std::vector<domain::StockLine> negatives;
    for (const auto& item : request.items) {
        if (item.quantity == 0) {
            throw domain::BadRequestException("Adjustment quantity must not be zero for product " + item.productId);
        }
        if (item.unitCost && item.unitCost->isNegative()) {
            throw domain::BadRequestException("Unit cost must not be negative for product " + item.productId);
        }
        productIds.push_back(item.productId);
        if (item.quantity < 0) {
            negatives.push_back({item.productId, -item.quantity});
        }
    }

    auto uow = uowFactory_->begin();
    validator_->validateProducts(*uow, tenantId, productIds);
    validator_->validateLocation(*uow, tenantId, request.locationId);
    if (!negatives.empty()) {
        validator_->validateStockAvailability(*uow, tenantId, request.locationId, negatives);
    }

    std::string note = request.note && !request.note->empty()
        ? request.reason + " - " + *request.note
        : request.reason;
    MovementContext context{tenantId, userId, request.locationId,
                            ReferenceType::ADJUSTMENT, std::nullopt, note, std::nullopt};

    domain::AdjustResult result;
    result.movementIds.resize(request.items.size());
    for (auto index : indicesByProduct(request.items)) {
        const auto& item = request.items[index];
        if (item.quantity > 0) {
            auto movement = recordInbound(*uow, context, item.productId, item.quantity,
                                          item.unitCost.value_or(Money::zero()));
            result.movementIds[index] = movement.id;
            ++result.positiveAdjustments;
        } else {
            auto record = recordOutbound(*uow, context, item.productId, -item.quantity);
            result.movementIds[index] = record.movement.id;
            ++result.negativeAdjustments;
        }
    }

    uow->commit();

    std::cout << "[MovementService] Adjust (" << request.reason << "): +"
              << result.positiveAdjustments << " / -" << result.negativeAdjustments
              << " at " << request.locationId << std::endl;
    return result;
}

domain::MovementDetail MovementService::findOne(const std::string& tenantId, const std::string& movementId) {
    auto uow = uowFactory_->begin();
    auto movement = uow->movements().findById(tenantId, movementId);
    if (!movement) {
        throw domain::NotFoundException("Stock movement not found: " + movementId);
    }

    domain::MovementDetail detail;
    detail.movement = *movement;
    if (movement->movementType == MovementType::OUT) {
        detail.consumptions = uow->layers().findConsumptionsByMovement(movementId);
    }
    return detail;
}

domain::StockMovement MovementService::recordInbound(
    IUnitOfWork& uow, const MovementContext& context,
    const std::string& productId, int64_t quantity, const Money& unitCost,
    const std::optional<std::string>& batchId)
{
    requirePositive(productId, quantity);

    domain::StockMovement movement;
    movement.id = utils::UuidGenerator::generate();
    movement.tenantId = context.tenantId;
    movement.productId = productId;
    movement.locationId = context.locationId;
    movement.movementType = MovementType::IN;
    movement.quantity = quantity;
    movement.unitCost = unitCost;
    movement.totalCost = unitCost * quantity;
    movement.referenceType = context.referenceType;
    movement.referenceId = context.referenceId;
    movement.note = context.note;
    movement.transferId = context.transferId;
    movement.createdById = context.userId;
    movement.createdAt = domain::Timestamp::now();
    uow.movements().insert(movement);

    valuation_->createLayer(uow, NewLayer{productId, context.locationId, context.tenantId,
                                          quantity, unitCost, movement.id, batchId});
    balances_->updateBalance(uow, productId, context.locationId, context.tenantId, quantity);

    return movement;
}

OutboundRecord MovementService::recordOutbound(
    IUnitOfWork& uow, const MovementContext& context,
    const std::string& productId, int64_t quantity,
    const std::optional<Money>& fixedUnitCost)
{
    requirePositive(productId, quantity);

    auto method = valuation_->resolvePricingMethod(uow, productId, context.tenantId);
    auto consumption = valuation_->consumeLayers(uow, productId, context.locationId,
                                                 context.tenantId, quantity, method);

    domain::StockMovement movement;
    movement.id = utils::UuidGenerator::generate();
    movement.tenantId = context.tenantId;
    movement.productId = productId;
    movement.locationId = context.locationId;
    movement.movementType = MovementType::OUT;
    movement.quantity = quantity;
    if (fixedUnitCost) {
        movement.unitCost = *fixedUnitCost;
        movement.totalCost = *fixedUnitCost * quantity;
    } else {
        movement.unitCost = Money::divide(consumption.totalCost, quantity);
        movement.totalCost = consumption.totalCost;
    }
    movement.referenceType = context.referenceType;
    movement.referenceId = context.referenceId;
    movement.note = context.note;
    movement.costingMethod = method;
    movement.transferId = context.transferId;
    movement.createdById = context.userId;
    movement.createdAt = domain::Timestamp::now();
    uow.movements().insert(movement);

    valuation_->createConsumptionRecords(uow, movement.id, consumption.consumptions);
    balances_->updateBalance(uow, productId, context.locationId, context.tenantId, -quantity);

    return {movement, consumption};
}

} // namespace inventory::application
