#include "application/ValuationEngine.hpp"
#include "domain/exceptions/InventoryException.hpp"
#include "utils/UuidGenerator.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <utility>

namespace inventory::application {

using domain::Money;
using domain::PricingMethod;
using ports::output::IUnitOfWork;
using ports::output::LayerOrder;

ValuationEngine::ValuationEngine(std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory)
    : uowFactory_(std::move(uowFactory))
{
    std::cout << "[ValuationEngine] Created" << std::endl;
}

PricingMethod ValuationEngine::resolvePricingMethod(
    IUnitOfWork& uow, const std::string& productId, const std::string& tenantId)
{
    auto product = uow.catalog().findProduct(tenantId, productId);
    if (!product) {
        return PricingMethod::FIFO;
    }
    if (product->pricingMethod) {
        return *product->pricingMethod;
    }
    return uow.catalog().findTenantPricingMethod(tenantId).value_or(PricingMethod::FIFO);
}

domain::ValuationLayer ValuationEngine::createLayer(IUnitOfWork& uow, const NewLayer& request) {
    if (request.quantity <= 0) {
        throw domain::BadRequestException(
            "Layer quantity must be positive, got " + std::to_string(request.quantity));
    }
    if (request.unitCost.isNegative()) {
        throw domain::BadRequestException(
            "Layer unit cost must not be negative, got " + request.unitCost.toString());
    }

    domain::ValuationLayer layer;
    layer.id = utils::UuidGenerator::generate();
    layer.tenantId = request.tenantId;
    layer.productId = request.productId;
    layer.locationId = request.locationId;
    layer.originalQty = request.quantity;
    layer.remainingQty = request.quantity;
    layer.unitCost = request.unitCost;
    layer.sourceMovementId = request.sourceMovementId;
    layer.batchId = request.batchId;
    layer.createdAt = domain::Timestamp::now();

    uow.layers().insert(layer);
    return layer;
}

domain::LayerConsumptionResult ValuationEngine::consumeLayers(
    IUnitOfWork& uow,
    const std::string& productId, const std::string& locationId, const std::string& tenantId,
    int64_t quantity, PricingMethod method)
{
    if (quantity <= 0) {
        throw domain::BadRequestException(
            "Consumption quantity must be positive, got " + std::to_string(quantity));
    }

    // MOVING_AVERAGE списывает слои от старых к новым, как FIFO
    auto order = method == PricingMethod::LIFO ? LayerOrder::NEWEST_FIRST : LayerOrder::OLDEST_FIRST;
    auto layers = uow.layers().findOpenForUpdate(tenantId, productId, locationId, order);

    std::optional<Money> averageCost;
    if (method == PricingMethod::MOVING_AVERAGE) {
        averageCost = weightedAverage(layers);
    }

    domain::LayerConsumptionResult result;
    int64_t remainingToConsume = quantity;

    for (const auto& layer : layers) {
        if (remainingToConsume <= 0) break;

        int64_t consumeQty = std::min(remainingToConsume, layer.remainingQty);
        Money unitCost = averageCost ? *averageCost : layer.unitCost;
        Money lineCost = unitCost * consumeQty;

        result.consumptions.push_back({layer.id, consumeQty, unitCost, lineCost});
        result.totalCost += lineCost;
        remainingToConsume -= consumeQty;

        uow.layers().decrementRemaining(layer.id, consumeQty);
    }

    if (remainingToConsume > 0) {
        std::cerr << "[ValuationEngine] Layers exhausted for product " << productId
                  << " at " << locationId << ": " << remainingToConsume
                  << " unit(s) consumed without cost" << std::endl;
    }

    return result;
}

Money ValuationEngine::calculateWAC(
    IUnitOfWork& uow,
    const std::string& productId, const std::string& locationId, const std::string& tenantId)
{
    auto layers = uow.layers().findOpenForUpdate(tenantId, productId, locationId, LayerOrder::OLDEST_FIRST);
    return weightedAverage(layers);
}

void ValuationEngine::createConsumptionRecords(
    IUnitOfWork& uow, const std::string& movementId,
    const std::vector<domain::LayerConsumption>& consumptions)
{
    if (consumptions.empty()) {
        return;
    }

    std::vector<domain::ValuationLayerConsumption> records;
    records.reserve(consumptions.size());
    for (const auto& c : consumptions) {
        records.push_back({c.layerId, movementId, c.quantity, c.unitCost});
    }
    uow.layers().insertConsumptions(records);
}

int64_t ValuationEngine::getAvailableQuantity(
    IUnitOfWork& uow,
    const std::string& productId, const std::string& locationId, const std::string& tenantId)
{
    return uow.layers().sumRemaining(tenantId, productId, locationId);
}

domain::ValuationReport ValuationEngine::getValuationReport(const std::string& tenantId) {
    auto uow = uowFactory_->begin();
    auto layers = uow->layers().findOpenByTenant(tenantId);

    // Группировка по (товар, склад) с сохранением порядка слоёв
    std::map<std::pair<std::string, std::string>, domain::ValuationLine> grouped;
    for (const auto& layer : layers) {
        auto& line = grouped[{layer.productId, layer.locationId}];
        line.productId = layer.productId;
        line.locationId = layer.locationId;

        Money value = layer.unitCost * layer.remainingQty;
        line.totalQuantity += layer.remainingQty;
        line.totalValue += value;
        line.layers.push_back({layer.id, layer.unitCost, layer.remainingQty, value, layer.createdAt});
    }

    domain::ValuationReport report;
    for (auto& [key, line] : grouped) {
        line.averageCost = Money::divide(line.totalValue, line.totalQuantity);
        report.totalUnits += line.totalQuantity;
        report.totalValue += line.totalValue;
        report.items.push_back(std::move(line));
    }
    uow->commit();
    return report;
}

Money ValuationEngine::weightedAverage(const std::vector<domain::ValuationLayer>& layers) {
    domain::Decimal totalValue(0);
    int64_t totalQty = 0;

    for (const auto& layer : layers) {
        totalValue += layer.unitCost.value() * domain::Decimal(layer.remainingQty);
        totalQty += layer.remainingQty;
    }

    if (totalQty <= 0) {
        return Money::zero();
    }
    return Money(totalValue / domain::Decimal(totalQty));
}

} // namespace inventory::application
