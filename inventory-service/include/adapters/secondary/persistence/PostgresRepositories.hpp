#pragma once

#include "ports/output/IBalanceRepository.hpp"
#include "ports/output/ICatalogRepository.hpp"
#include "ports/output/IStockMovementRepository.hpp"
#include "ports/output/IStockReservationRepository.hpp"
#include "ports/output/IStockTransferRepository.hpp"
#include "ports/output/IValuationLayerRepository.hpp"

#include <pqxx/pqxx>

namespace inventory::adapters::secondary {

/**
 * @brief Репозитории PostgreSQL поверх одной транзакции pqxx::work
 *
 * Все запросы идут через транзакцию единицы работы; сами
 * репозитории ничего не коммитят.
 */

class PostgresCatalogRepository : public ports::output::ICatalogRepository {
public:
    explicit PostgresCatalogRepository(pqxx::work& txn) : txn_(txn) {}

    std::vector<domain::Product> findProducts(
        const std::string& tenantId, const std::vector<std::string>& productIds) override;
    std::optional<domain::Product> findProduct(
        const std::string& tenantId, const std::string& productId) override;
    std::vector<domain::Location> findLocations(
        const std::string& tenantId, const std::vector<std::string>& locationIds) override;
    std::optional<domain::PricingMethod> findTenantPricingMethod(const std::string& tenantId) override;

private:
    pqxx::work& txn_;
};

/**
 * Таблица: inventory_balances, PK (tenant_id, product_id, location_id)
 */
class PostgresBalanceRepository : public ports::output::IBalanceRepository {
public:
    explicit PostgresBalanceRepository(pqxx::work& txn) : txn_(txn) {}

    std::optional<domain::Balance> find(
        const std::string& tenantId, const std::string& productId, const std::string& locationId) override;
    std::vector<domain::Balance> lockForUpdate(
        const std::string& tenantId, const std::string& locationId,
        const std::vector<std::string>& productIds) override;
    void incrementOnHand(const std::string& tenantId, const std::string& productId,
                         const std::string& locationId, int64_t delta) override;
    void incrementReserved(const std::string& tenantId, const std::string& productId,
                           const std::string& locationId, int64_t delta) override;
    std::vector<domain::Balance> findByProduct(const std::string& tenantId, const std::string& productId) override;
    std::vector<domain::Balance> findByLocation(const std::string& tenantId, const std::string& locationId) override;

    std::vector<domain::LowStockLine> findBelowReorderLevel(
        const std::string& tenantId, const std::optional<std::string>& locationId) override;

private:
    pqxx::work& txn_;
};

/**
 * Таблицы: valuation_layers (seq задаёт порядок при равных created_at),
 * valuation_layer_consumptions
 */
class PostgresValuationLayerRepository : public ports::output::IValuationLayerRepository {
public:
    explicit PostgresValuationLayerRepository(pqxx::work& txn) : txn_(txn) {}

    void insert(const domain::ValuationLayer& layer) override;
    std::vector<domain::ValuationLayer> findOpenForUpdate(
        const std::string& tenantId, const std::string& productId,
        const std::string& locationId, ports::output::LayerOrder order) override;
    std::vector<domain::ValuationLayer> findAll(
        const std::string& tenantId, const std::string& productId, const std::string& locationId) override;
    std::vector<domain::ValuationLayer> findOpenByTenant(const std::string& tenantId) override;
    int64_t sumRemaining(
        const std::string& tenantId, const std::string& productId, const std::string& locationId) override;
    void decrementRemaining(const std::string& layerId, int64_t quantity) override;
    void insertConsumptions(const std::vector<domain::ValuationLayerConsumption>& consumptions) override;
    std::vector<domain::ValuationLayerConsumption> findConsumptionsByMovement(const std::string& movementId) override;

private:
    pqxx::work& txn_;
};

class PostgresStockMovementRepository : public ports::output::IStockMovementRepository {
public:
    explicit PostgresStockMovementRepository(pqxx::work& txn) : txn_(txn) {}

    void insert(const domain::StockMovement& movement) override;
    std::optional<domain::StockMovement> findById(const std::string& tenantId, const std::string& movementId) override;
    std::vector<domain::StockMovement> findByTransfer(
        const std::string& tenantId, const std::string& transferId) override;

private:
    pqxx::work& txn_;
};

/**
 * Таблицы: stock_transfers, stock_transfer_items, transfer_sequences
 */
class PostgresStockTransferRepository : public ports::output::IStockTransferRepository {
public:
    explicit PostgresStockTransferRepository(pqxx::work& txn) : txn_(txn) {}

    int64_t nextSequence(const std::string& tenantId, int year) override;
    void insert(const domain::StockTransfer& transfer) override;
    std::optional<domain::StockTransfer> findById(const std::string& tenantId, const std::string& transferId) override;
    std::optional<domain::StockTransfer> findForUpdate(
        const std::string& tenantId, const std::string& transferId) override;
    void update(const domain::StockTransfer& transfer) override;

private:
    pqxx::work& txn_;

    std::optional<domain::StockTransfer> load(
        const std::string& tenantId, const std::string& transferId, bool forUpdate);
};

class PostgresStockReservationRepository : public ports::output::IStockReservationRepository {
public:
    explicit PostgresStockReservationRepository(pqxx::work& txn) : txn_(txn) {}

    void insert(const domain::StockReservation& reservation) override;
    std::optional<domain::StockReservation> findById(
        const std::string& tenantId, const std::string& reservationId) override;
    std::optional<domain::StockReservation> findForUpdate(
        const std::string& tenantId, const std::string& reservationId) override;
    void update(const domain::StockReservation& reservation) override;
    std::vector<domain::StockReservation> findAllActive() override;

private:
    pqxx::work& txn_;

    std::optional<domain::StockReservation> load(
        const std::string& tenantId, const std::string& reservationId, bool forUpdate);
};

} // namespace inventory::adapters::secondary
