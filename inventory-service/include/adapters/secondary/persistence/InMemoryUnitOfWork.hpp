#pragma once

#include "adapters/secondary/persistence/InMemoryStore.hpp"
#include "ports/output/IUnitOfWork.hpp"

#include <memory>
#include <mutex>

namespace inventory::adapters::secondary {

class InMemoryCatalogRepository : public ports::output::ICatalogRepository {
public:
    explicit InMemoryCatalogRepository(InMemoryState& state) : state_(state) {}

    std::vector<domain::Product> findProducts(
        const std::string& tenantId, const std::vector<std::string>& productIds) override;
    std::optional<domain::Product> findProduct(
        const std::string& tenantId, const std::string& productId) override;
    std::vector<domain::Location> findLocations(
        const std::string& tenantId, const std::vector<std::string>& locationIds) override;
    std::optional<domain::PricingMethod> findTenantPricingMethod(const std::string& tenantId) override;

private:
    InMemoryState& state_;
};

class InMemoryBalanceRepository : public ports::output::IBalanceRepository {
public:
    explicit InMemoryBalanceRepository(InMemoryState& state) : state_(state) {}

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
    InMemoryState& state_;

    domain::Balance& row(const std::string& tenantId, const std::string& productId, const std::string& locationId);
};

class InMemoryValuationLayerRepository : public ports::output::IValuationLayerRepository {
public:
    explicit InMemoryValuationLayerRepository(InMemoryState& state) : state_(state) {}

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
    InMemoryState& state_;

    /// Слои по порядку (createdAt, порядок вставки)
    std::vector<domain::ValuationLayer> ordered(
        const std::string& tenantId, const std::string& productId,
        const std::string& locationId, bool openOnly) const;
};

class InMemoryStockMovementRepository : public ports::output::IStockMovementRepository {
public:
    explicit InMemoryStockMovementRepository(InMemoryState& state) : state_(state) {}

    void insert(const domain::StockMovement& movement) override;
    std::optional<domain::StockMovement> findById(const std::string& tenantId, const std::string& movementId) override;
    std::vector<domain::StockMovement> findByTransfer(
        const std::string& tenantId, const std::string& transferId) override;

private:
    InMemoryState& state_;
};

class InMemoryStockTransferRepository : public ports::output::IStockTransferRepository {
public:
    explicit InMemoryStockTransferRepository(InMemoryState& state) : state_(state) {}

    int64_t nextSequence(const std::string& tenantId, int year) override;
    void insert(const domain::StockTransfer& transfer) override;
    std::optional<domain::StockTransfer> findById(const std::string& tenantId, const std::string& transferId) override;
    std::optional<domain::StockTransfer> findForUpdate(
        const std::string& tenantId, const std::string& transferId) override;
    void update(const domain::StockTransfer& transfer) override;

private:
    InMemoryState& state_;
};

class InMemoryStockReservationRepository : public ports::output::IStockReservationRepository {
public:
    explicit InMemoryStockReservationRepository(InMemoryState& state) : state_(state) {}

    void insert(const domain::StockReservation& reservation) override;
    std::optional<domain::StockReservation> findById(
        const std::string& tenantId, const std::string& reservationId) override;
    std::optional<domain::StockReservation> findForUpdate(
        const std::string& tenantId, const std::string& reservationId) override;
    void update(const domain::StockReservation& reservation) override;
    std::vector<domain::StockReservation> findAllActive() override;

private:
    InMemoryState& state_;
};

/**
 * @brief Единица работы над копией состояния InMemoryStore
 */
class InMemoryUnitOfWork : public ports::output::IUnitOfWork {
public:
    explicit InMemoryUnitOfWork(InMemoryStore& store);
    ~InMemoryUnitOfWork() override = default;

    ports::output::ICatalogRepository& catalog() override { return catalog_; }
    ports::output::IBalanceRepository& balances() override { return balances_; }
    ports::output::IValuationLayerRepository& layers() override { return layers_; }
    ports::output::IStockMovementRepository& movements() override { return movements_; }
    ports::output::IStockTransferRepository& transfers() override { return transfers_; }
    ports::output::IStockReservationRepository& reservations() override { return reservations_; }

    /// @throws std::logic_error при повторном commit
    void commit() override;

private:
    InMemoryStore& store_;
    std::unique_lock<std::mutex> lock_;
    InMemoryState working_;
    bool committed_ = false;

    InMemoryCatalogRepository catalog_;
    InMemoryBalanceRepository balances_;
    InMemoryValuationLayerRepository layers_;
    InMemoryStockMovementRepository movements_;
    InMemoryStockTransferRepository transfers_;
    InMemoryStockReservationRepository reservations_;
};

class InMemoryUnitOfWorkFactory : public ports::output::IUnitOfWorkFactory {
public:
    explicit InMemoryUnitOfWorkFactory(std::shared_ptr<InMemoryStore> store);

    std::unique_ptr<ports::output::IUnitOfWork> begin() override;

private:
    std::shared_ptr<InMemoryStore> store_;
};

} // namespace inventory::adapters::secondary
