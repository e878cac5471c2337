#pragma once

#include "domain/Balance.hpp"
#include "domain/Catalog.hpp"
#include "domain/StockMovement.hpp"
#include "domain/StockReservation.hpp"
#include "domain/StockTransfer.hpp"
#include "domain/ValuationLayer.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace inventory::adapters::secondary {

using BalanceKey = std::tuple<std::string, std::string, std::string>;  // tenant, product, location

/**
 * @brief Всё состояние хранилища; копируется в единицу работы целиком
 */
struct InMemoryState {
    std::map<std::string, domain::Product> products;
    std::map<std::string, domain::Location> locations;
    std::map<std::string, domain::PricingMethod> tenantPricingMethods;

    std::map<BalanceKey, domain::Balance> balances;
    std::vector<domain::ValuationLayer> layers;  // порядок вставки разрешает равные createdAt
    std::vector<domain::ValuationLayerConsumption> consumptions;
    std::vector<domain::StockMovement> movements;
    std::map<std::string, domain::StockTransfer> transfers;
    std::map<std::pair<std::string, int>, int64_t> transferSequences;
    std::map<std::string, domain::StockReservation> reservations;
};

/**
 * @brief Хранилище в памяти для тестов и запуска без БД
 *
 * Один mutex держится всё время жизни единицы работы, поэтому
 * транзакции строго последовательны. Изменения видны другим только
 * после commit().
 */
class InMemoryStore {
public:
    InMemoryStore() = default;

    InMemoryStore(const InMemoryStore&) = delete;
    InMemoryStore& operator=(const InMemoryStore&) = delete;

    // Каталог принадлежит другому модулю, здесь только наполнение
    void addProduct(const domain::Product& product);
    void addLocation(const domain::Location& location);
    void setTenantPricingMethod(const std::string& tenantId, domain::PricingMethod method);

private:
    friend class InMemoryUnitOfWork;

    std::mutex mutex_;
    InMemoryState state_;
};

} // namespace inventory::adapters::secondary
