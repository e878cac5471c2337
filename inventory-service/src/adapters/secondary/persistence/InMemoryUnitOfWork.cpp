#include "adapters/secondary/persistence/InMemoryUnitOfWork.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <stdexcept>
#include <utility>

namespace inventory::adapters::secondary {

using domain::Balance;
using domain::ValuationLayer;

// ============================================
// InMemoryStore
// ============================================

void InMemoryStore::addProduct(const domain::Product& product) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.products[product.id] = product;
}

void InMemoryStore::addLocation(const domain::Location& location) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.locations[location.id] = location;
}

void InMemoryStore::setTenantPricingMethod(const std::string& tenantId, domain::PricingMethod method) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.tenantPricingMethods[tenantId] = method;
}

// ============================================
// Catalog
// ============================================

std::vector<domain::Product> InMemoryCatalogRepository::findProducts(
    const std::string& tenantId, const std::vector<std::string>& productIds)
{
    std::vector<domain::Product> result;
    std::set<std::string> seen;
    for (const auto& id : productIds) {
        if (!seen.insert(id).second) continue;
        auto product = findProduct(tenantId, id);
        if (product) {
            result.push_back(*product);
        }
    }
    return result;
}

std::optional<domain::Product> InMemoryCatalogRepository::findProduct(
    const std::string& tenantId, const std::string& productId)
{
    auto it = state_.products.find(productId);
    if (it == state_.products.end() || it->second.tenantId != tenantId || it->second.deleted) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<domain::Location> InMemoryCatalogRepository::findLocations(
    const std::string& tenantId, const std::vector<std::string>& locationIds)
{
    std::vector<domain::Location> result;
    std::set<std::string> seen;
    for (const auto& id : locationIds) {
        if (!seen.insert(id).second) continue;
        auto it = state_.locations.find(id);
        if (it != state_.locations.end() && it->second.tenantId == tenantId) {
            result.push_back(it->second);
        }
    }
    return result;
}

std::optional<domain::PricingMethod> InMemoryCatalogRepository::findTenantPricingMethod(const std::string& tenantId) {
    auto it = state_.tenantPricingMethods.find(tenantId);
    if (it == state_.tenantPricingMethods.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================
// Balances
// ============================================

std::optional<Balance> InMemoryBalanceRepository::find(
    const std::string& tenantId, const std::string& productId, const std::string& locationId)
{
    auto it = state_.balances.find(BalanceKey{tenantId, productId, locationId});
    if (it == state_.balances.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Balance> InMemoryBalanceRepository::lockForUpdate(
    const std::string& tenantId, const std::string& locationId,
    const std::vector<std::string>& productIds)
{
    // Блокировка не нужна: вся единица работы под mutex хранилища
    std::set<std::string> sorted(productIds.begin(), productIds.end());
    std::vector<Balance> result;
    for (const auto& productId : sorted) {
        auto balance = find(tenantId, productId, locationId);
        if (balance) {
            result.push_back(*balance);
        }
    }
    return result;
}

Balance& InMemoryBalanceRepository::row(
    const std::string& tenantId, const std::string& productId, const std::string& locationId)
{
    BalanceKey key{tenantId, productId, locationId};
    auto it = state_.balances.find(key);
    if (it == state_.balances.end()) {
        Balance balance;
        balance.tenantId = tenantId;
        balance.productId = productId;
        balance.locationId = locationId;
        it = state_.balances.emplace(key, balance).first;
    }
    return it->second;
}

void InMemoryBalanceRepository::incrementOnHand(
    const std::string& tenantId, const std::string& productId,
    const std::string& locationId, int64_t delta)
{
    bool existed = state_.balances.count(BalanceKey{tenantId, productId, locationId}) > 0;
    auto& balance = row(tenantId, productId, locationId);
    balance.onHandQuantity = existed ? balance.onHandQuantity + delta : std::max<int64_t>(0, delta);
}

void InMemoryBalanceRepository::incrementReserved(
    const std::string& tenantId, const std::string& productId,
    const std::string& locationId, int64_t delta)
{
    bool existed = state_.balances.count(BalanceKey{tenantId, productId, locationId}) > 0;
    auto& balance = row(tenantId, productId, locationId);
    balance.reservedQuantity = existed ? balance.reservedQuantity + delta : std::max<int64_t>(0, delta);
}

std::vector<Balance> InMemoryBalanceRepository::findByProduct(
    const std::string& tenantId, const std::string& productId)
{
    std::vector<Balance> result;
    for (const auto& entry : state_.balances) {
        if (entry.second.tenantId == tenantId && entry.second.productId == productId) {
            result.push_back(entry.second);
        }
    }
    return result;
}

std::vector<Balance> InMemoryBalanceRepository::findByLocation(
    const std::string& tenantId, const std::string& locationId)
{
    std::vector<Balance> result;
    for (const auto& entry : state_.balances) {
        if (entry.second.tenantId == tenantId && entry.second.locationId == locationId) {
            result.push_back(entry.second);
        }
    }
    return result;
}

std::vector<domain::LowStockLine> InMemoryBalanceRepository::findBelowReorderLevel(
    const std::string& tenantId, const std::optional<std::string>& locationId)
{
    std::vector<domain::LowStockLine> result;
    for (const auto& entry : state_.balances) {
        const auto& balance = entry.second;
        if (balance.tenantId != tenantId || (locationId && balance.locationId != *locationId)) {
            continue;
        }
        auto product = state_.products.find(balance.productId);
        auto location = state_.locations.find(balance.locationId);
        if (product == state_.products.end() || location == state_.locations.end()) {
            continue;
        }
        const auto& p = product->second;
        if (p.deleted || p.reorderLevel <= 0 || balance.onHandQuantity >= p.reorderLevel) {
            continue;
        }

        domain::LowStockLine line;
        line.productId = p.id;
        line.productName = p.name;
        line.productSku = p.sku;
        line.locationId = balance.locationId;
        line.locationName = location->second.name;
        line.onHandQuantity = balance.onHandQuantity;
        line.reorderLevel = p.reorderLevel;
        line.shortage = p.reorderLevel - balance.onHandQuantity;
        result.push_back(line);
    }
    std::stable_sort(result.begin(), result.end(), [](const domain::LowStockLine& a, const domain::LowStockLine& b) {
        return a.shortage > b.shortage;
    });
    return result;
}

// ============================================
// Valuation layers
// ============================================

void InMemoryValuationLayerRepository::insert(const ValuationLayer& layer) {
    state_.layers.push_back(layer);
}

std::vector<ValuationLayer> InMemoryValuationLayerRepository::ordered(
    const std::string& tenantId, const std::string& productId,
    const std::string& locationId, bool openOnly) const
{
    std::vector<ValuationLayer> result;
    for (const auto& layer : state_.layers) {
        if (layer.tenantId != tenantId || layer.productId != productId || layer.locationId != locationId) {
            continue;
        }
        if (openOnly && layer.remainingQty <= 0) {
            continue;
        }
        result.push_back(layer);
    }
    // stable_sort сохраняет порядок вставки при равных createdAt
    std::stable_sort(result.begin(), result.end(), [](const ValuationLayer& a, const ValuationLayer& b) {
        return a.createdAt < b.createdAt;
    });
    return result;
}

std::vector<ValuationLayer> InMemoryValuationLayerRepository::findOpenForUpdate(
    const std::string& tenantId, const std::string& productId,
    const std::string& locationId, ports::output::LayerOrder order)
{
    auto result = ordered(tenantId, productId, locationId, true);
    if (order == ports::output::LayerOrder::NEWEST_FIRST) {
        std::reverse(result.begin(), result.end());
    }
    return result;
}

std::vector<ValuationLayer> InMemoryValuationLayerRepository::findAll(
    const std::string& tenantId, const std::string& productId, const std::string& locationId)
{
    return ordered(tenantId, productId, locationId, false);
}

std::vector<ValuationLayer> InMemoryValuationLayerRepository::findOpenByTenant(const std::string& tenantId) {
    std::vector<ValuationLayer> result;
    for (const auto& layer : state_.layers) {
        if (layer.tenantId == tenantId && layer.remainingQty > 0) {
            result.push_back(layer);
        }
    }
    std::stable_sort(result.begin(), result.end(), [](const ValuationLayer& a, const ValuationLayer& b) {
        return a.createdAt < b.createdAt;
    });
    return result;
}

int64_t InMemoryValuationLayerRepository::sumRemaining(
    const std::string& tenantId, const std::string& productId, const std::string& locationId)
{
    int64_t total = 0;
    for (const auto& layer : state_.layers) {
        if (layer.tenantId == tenantId && layer.productId == productId && layer.locationId == locationId) {
            total += layer.remainingQty;
        }
    }
    return total;
}

void InMemoryValuationLayerRepository::decrementRemaining(const std::string& layerId, int64_t quantity) {
    for (auto& layer : state_.layers) {
        if (layer.id == layerId) {
            layer.remainingQty -= quantity;
            return;
        }
    }
    throw std::out_of_range("Valuation layer not found: " + layerId);
}

void InMemoryValuationLayerRepository::insertConsumptions(
    const std::vector<domain::ValuationLayerConsumption>& consumptions)
{
    state_.consumptions.insert(state_.consumptions.end(), consumptions.begin(), consumptions.end());
}

std::vector<domain::ValuationLayerConsumption> InMemoryValuationLayerRepository::findConsumptionsByMovement(
    const std::string& movementId)
{
    std::vector<domain::ValuationLayerConsumption> result;
    for (const auto& consumption : state_.consumptions) {
        if (consumption.stockMovementId == movementId) {
            result.push_back(consumption);
        }
    }
    return result;
}

// ============================================
// Movements
// ============================================

void InMemoryStockMovementRepository::insert(const domain::StockMovement& movement) {
    state_.movements.push_back(movement);
}

std::optional<domain::StockMovement> InMemoryStockMovementRepository::findById(
    const std::string& tenantId, const std::string& movementId)
{
    for (const auto& movement : state_.movements) {
        if (movement.id == movementId && movement.tenantId == tenantId) {
            return movement;
        }
    }
    return std::nullopt;
}

std::vector<domain::StockMovement> InMemoryStockMovementRepository::findByTransfer(
    const std::string& tenantId, const std::string& transferId)
{
    std::vector<domain::StockMovement> result;
    for (const auto& movement : state_.movements) {
        if (movement.tenantId == tenantId && movement.transferId == transferId) {
            result.push_back(movement);
        }
    }
    return result;
}

// ============================================
// Transfers
// ============================================

int64_t InMemoryStockTransferRepository::nextSequence(const std::string& tenantId, int year) {
    return ++state_.transferSequences[{tenantId, year}];
}

void InMemoryStockTransferRepository::insert(const domain::StockTransfer& transfer) {
    state_.transfers[transfer.id] = transfer;
}

std::optional<domain::StockTransfer> InMemoryStockTransferRepository::findById(
    const std::string& tenantId, const std::string& transferId)
{
    auto it = state_.transfers.find(transferId);
    if (it == state_.transfers.end() || it->second.tenantId != tenantId) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<domain::StockTransfer> InMemoryStockTransferRepository::findForUpdate(
    const std::string& tenantId, const std::string& transferId)
{
    return findById(tenantId, transferId);
}

void InMemoryStockTransferRepository::update(const domain::StockTransfer& transfer) {
    auto it = state_.transfers.find(transfer.id);
    if (it == state_.transfers.end()) {
        throw std::out_of_range("Transfer not found: " + transfer.id);
    }
    it->second = transfer;
}

// ============================================
// Reservations
// ============================================

void InMemoryStockReservationRepository::insert(const domain::StockReservation& reservation) {
    state_.reservations[reservation.id] = reservation;
}

std::optional<domain::StockReservation> InMemoryStockReservationRepository::findById(
    const std::string& tenantId, const std::string& reservationId)
{
    auto it = state_.reservations.find(reservationId);
    if (it == state_.reservations.end() || it->second.tenantId != tenantId) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<domain::StockReservation> InMemoryStockReservationRepository::findForUpdate(
    const std::string& tenantId, const std::string& reservationId)
{
    return findById(tenantId, reservationId);
}

void InMemoryStockReservationRepository::update(const domain::StockReservation& reservation) {
    auto it = state_.reservations.find(reservation.id);
    if (it == state_.reservations.end()) {
        throw std::out_of_range("Reservation not found: " + reservation.id);
    }
    it->second = reservation;
}

std::vector<domain::StockReservation> InMemoryStockReservationRepository::findAllActive() {
    std::vector<domain::StockReservation> result;
    for (const auto& entry : state_.reservations) {
        if (entry.second.isActive()) {
            result.push_back(entry.second);
        }
    }
    return result;
}

// ============================================
// Unit of work
// ============================================

InMemoryUnitOfWork::InMemoryUnitOfWork(InMemoryStore& store)
    : store_(store)
    , lock_(store.mutex_)
    , working_(store.state_)
    , catalog_(working_)
    , balances_(working_)
    , layers_(working_)
    , movements_(working_)
    , transfers_(working_)
    , reservations_(working_)
{
}

void InMemoryUnitOfWork::commit() {
    if (committed_) {
        throw std::logic_error("Unit of work already committed");
    }
    store_.state_ = std::move(working_);
    committed_ = true;
    lock_.unlock();
}

InMemoryUnitOfWorkFactory::InMemoryUnitOfWorkFactory(std::shared_ptr<InMemoryStore> store)
    : store_(std::move(store))
{
    std::cout << "[InMemoryUnitOfWorkFactory] Created" << std::endl;
}

std::unique_ptr<ports::output::IUnitOfWork> InMemoryUnitOfWorkFactory::begin() {
    return std::make_unique<InMemoryUnitOfWork>(*store_);
}

} // namespace inventory::adapters::secondary
