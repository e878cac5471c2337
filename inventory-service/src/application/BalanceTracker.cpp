#include "application/BalanceTracker.hpp"
#include "domain/exceptions/InventoryException.hpp"

#include <iostream>
#include <map>
#include <utility>

namespace inventory::application {

BalanceTracker::BalanceTracker(std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory)
    : uowFactory_(std::move(uowFactory))
{
    std::cout << "[BalanceTracker] Created" << std::endl;
}

void BalanceTracker::updateBalance(ports::output::IUnitOfWork& uow,
                                   const std::string& productId, const std::string& locationId,
                                   const std::string& tenantId, int64_t delta)
{
    if (delta == 0) return;
    uow.balances().incrementOnHand(tenantId, productId, locationId, delta);
}

void BalanceTracker::updateReserved(ports::output::IUnitOfWork& uow,
                                    const std::string& productId, const std::string& locationId,
                                    const std::string& tenantId, int64_t delta)
{
    if (delta == 0) return;
    uow.balances().incrementReserved(tenantId, productId, locationId, delta);
}

domain::Balance BalanceTracker::getBalance(const std::string& tenantId,
                                           const std::string& productId, const std::string& locationId)
{
    auto uow = uowFactory_->begin();
    auto balance = uow->balances().find(tenantId, productId, locationId);
    uow->commit();

    if (balance) {
        return *balance;
    }
    domain::Balance empty;
    empty.tenantId = tenantId;
    empty.productId = productId;
    empty.locationId = locationId;
    return empty;
}

domain::ProductBalanceSummary BalanceTracker::getProductSummary(
    const std::string& tenantId, const std::string& productId)
{
    auto uow = uowFactory_->begin();

    auto product = uow->catalog().findProduct(tenantId, productId);
    if (!product) {
        throw domain::NotFoundException("Product not found");
    }

    auto balances = uow->balances().findByProduct(tenantId, productId);

    std::vector<std::string> locationIds;
    for (const auto& b : balances) {
        locationIds.push_back(b.locationId);
    }
    std::map<std::string, std::string> locationNames;
    for (const auto& location : uow->catalog().findLocations(tenantId, locationIds)) {
        locationNames[location.id] = location.name;
    }

    domain::ProductBalanceSummary summary;
    summary.productId = product->id;
    summary.productName = product->name;
    summary.productSku = product->sku;

    for (const auto& b : balances) {
        domain::LocationBalanceLine line;
        line.locationId = b.locationId;
        line.locationName = locationNames.count(b.locationId) ? locationNames[b.locationId] : b.locationId;
        line.onHandQuantity = b.onHandQuantity;
        line.reservedQuantity = b.reservedQuantity;
        line.availableQuantity = b.available();

        summary.totalOnHand += line.onHandQuantity;
        summary.totalReserved += line.reservedQuantity;
        summary.totalAvailable += line.availableQuantity;
        summary.locations.push_back(std::move(line));
    }

    uow->commit();
    return summary;
}

domain::LocationBalanceSummary BalanceTracker::getLocationSummary(
    const std::string& tenantId, const std::string& locationId)
{
    auto uow = uowFactory_->begin();

    auto locations = uow->catalog().findLocations(tenantId, {locationId});
    if (locations.empty()) {
        throw domain::NotFoundException("Location not found");
    }
    const auto& location = locations.front();

    auto balances = uow->balances().findByLocation(tenantId, locationId);

    std::vector<std::string> productIds;
    for (const auto& b : balances) {
        productIds.push_back(b.productId);
    }
    std::map<std::string, domain::Product> products;
    for (auto& product : uow->catalog().findProducts(tenantId, productIds)) {
        products[product.id] = std::move(product);
    }

    domain::LocationBalanceSummary summary;
    summary.locationId = location.id;
    summary.locationName = location.name;
    summary.locationCode = location.code.value_or("");

    for (const auto& b : balances) {
        domain::ProductBalanceLine line;
        line.productId = b.productId;
        auto it = products.find(b.productId);
        if (it != products.end()) {
            line.productName = it->second.name;
            line.productSku = it->second.sku;
        }
        line.onHandQuantity = b.onHandQuantity;
        line.reservedQuantity = b.reservedQuantity;
        line.availableQuantity = b.available();

        summary.totalUnits += line.onHandQuantity;
        summary.products.push_back(std::move(line));
    }
    summary.productCount = summary.products.size();

    uow->commit();
    return summary;
}

std::vector<domain::LowStockLine> BalanceTracker::getLowStock(
    const std::string& tenantId, const std::optional<std::string>& locationId)
{
    auto uow = uowFactory_->begin();
    auto lines = uow->balances().findBelowReorderLevel(tenantId, locationId);
    uow->commit();
    return lines;
}

} // namespace inventory::application
