#pragma once

#include "adapters/secondary/persistence/PostgresRepositories.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "settings/DbSettings.hpp"

#include <pqxx/pqxx>
#include <memory>

namespace inventory::adapters::secondary {

/**
 * @brief Единица работы PostgreSQL: своё соединение и pqxx::work
 *
 * Деструктор pqxx::work без commit() выполняет ROLLBACK.
 */
class PostgresUnitOfWork : public ports::output::IUnitOfWork {
public:
    explicit PostgresUnitOfWork(const std::string& connectionString);

    ports::output::ICatalogRepository& catalog() override { return catalog_; }
    ports::output::IBalanceRepository& balances() override { return balances_; }
    ports::output::IValuationLayerRepository& layers() override { return layers_; }
    ports::output::IStockMovementRepository& movements() override { return movements_; }
    ports::output::IStockTransferRepository& transfers() override { return transfers_; }
    ports::output::IStockReservationRepository& reservations() override { return reservations_; }

    void commit() override;

private:
    pqxx::connection conn_;
    pqxx::work txn_;

    PostgresCatalogRepository catalog_;
    PostgresBalanceRepository balances_;
    PostgresValuationLayerRepository layers_;
    PostgresStockMovementRepository movements_;
    PostgresStockTransferRepository transfers_;
    PostgresStockReservationRepository reservations_;
};

class PostgresUnitOfWorkFactory : public ports::output::IUnitOfWorkFactory {
public:
    /// Проверяет соединение и создаёт схему, если её нет
    explicit PostgresUnitOfWorkFactory(std::shared_ptr<settings::DbSettings> settings);

    std::unique_ptr<ports::output::IUnitOfWork> begin() override;

private:
    std::shared_ptr<settings::DbSettings> settings_;

    void initSchema();
};

} // namespace inventory::adapters::secondary
