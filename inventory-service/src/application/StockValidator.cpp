#include "application/StockValidator.hpp"
#include "domain/exceptions/InventoryException.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <sstream>

namespace inventory::application {

namespace {

std::vector<std::string> unique(const std::vector<std::string>& ids) {
    std::vector<std::string> result;
    std::set<std::string> seen;
    for (const auto& id : ids) {
        if (seen.insert(id).second) {
            result.push_back(id);
        }
    }
    return result;
}

std::string join(const std::vector<std::string>& values) {
    std::ostringstream ss;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << values[i];
    }
    return ss.str();
}

} // namespace

StockValidator::StockValidator() {
    std::cout << "[StockValidator] Created" << std::endl;
}

void StockValidator::validateProducts(ports::output::IUnitOfWork& uow,
                                      const std::string& tenantId,
                                      const std::vector<std::string>& productIds)
{
    auto requested = unique(productIds);
    auto products = uow.catalog().findProducts(tenantId, requested);

    if (products.size() != requested.size()) {
        std::set<std::string> found;
        for (const auto& p : products) {
            found.insert(p.id);
        }
        std::vector<std::string> missing;
        for (const auto& id : requested) {
            if (!found.count(id)) {
                missing.push_back(id);
            }
        }
        throw domain::NotFoundException("Products not found: " + join(missing));
    }

    std::vector<std::string> parents;
    for (const auto& p : products) {
        if (p.productType == domain::ProductType::VARIABLE) {
            parents.push_back(p.name);
        }
    }
    if (!parents.empty()) {
        throw domain::BadRequestException(
            "Cannot perform stock operations on parent products: " + join(parents) +
            ". Stock should be managed on variant products.");
    }
}

domain::Location StockValidator::validateLocation(ports::output::IUnitOfWork& uow,
                                                  const std::string& tenantId,
                                                  const std::string& locationId)
{
    auto locations = uow.catalog().findLocations(tenantId, {locationId});
    for (const auto& location : locations) {
        if (location.id == locationId && location.active) {
            return location;
        }
    }
    throw domain::NotFoundException("Location not found: " + locationId);
}

std::map<std::string, domain::Location> StockValidator::validateLocations(
    ports::output::IUnitOfWork& uow,
    const std::string& tenantId, const std::vector<std::string>& locationIds)
{
    auto requested = unique(locationIds);

    std::map<std::string, domain::Location> byId;
    for (auto& location : uow.catalog().findLocations(tenantId, requested)) {
        if (location.active) {
            byId[location.id] = std::move(location);
        }
    }

    for (const auto& id : requested) {
        if (!byId.count(id)) {
            throw domain::NotFoundException("Location not found: " + id);
        }
    }
    return byId;
}

void StockValidator::validateStockAvailability(ports::output::IUnitOfWork& uow,
                                               const std::string& tenantId,
                                               const std::string& locationId,
                                               const std::vector<domain::StockLine>& items)
{
    // Суммируем по товару, сохраняя порядок первого появления
    std::vector<std::string> order;
    std::map<std::string, int64_t> requested;
    for (const auto& item : items) {
        if (!requested.count(item.productId)) {
            order.push_back(item.productId);
        }
        requested[item.productId] += item.quantity;
    }

    std::map<std::string, domain::Balance> balances;
    for (auto& b : uow.balances().lockForUpdate(tenantId, locationId, order)) {
        balances[b.productId] = std::move(b);
    }

    for (const auto& productId : order) {
        int64_t onHand = 0;
        int64_t reserved = 0;
        auto it = balances.find(productId);
        if (it != balances.end()) {
            onHand = it->second.onHandQuantity;
            reserved = it->second.reservedQuantity;
        }
        int64_t available = onHand - reserved;
        int64_t quantity = requested[productId];

        if (available < quantity) {
            auto product = uow.catalog().findProduct(tenantId, productId);
            std::string name = product ? product->name : productId;

            std::ostringstream msg;
            msg << "Insufficient stock for \"" << name << "\". On-hand: " << onHand
                << ", Reserved: " << reserved << ", Available: " << available
                << ", Requested: " << quantity;
            throw domain::BadRequestException(msg.str());
        }
    }
}

Availability StockValidator::getAvailability(ports::output::IUnitOfWork& uow,
                                             const std::string& tenantId,
                                             const std::string& locationId,
                                             const std::string& productId)
{
    Availability result;
    auto locked = uow.balances().lockForUpdate(tenantId, locationId, {productId});
    if (!locked.empty()) {
        result.onHand = locked.front().onHandQuantity;
        result.reserved = locked.front().reservedQuantity;
    }
    result.available = result.onHand - result.reserved;
    return result;
}

} // namespace inventory::application
