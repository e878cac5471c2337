#include "adapters/secondary/persistence/PostgresUnitOfWork.hpp"
#include "adapters/secondary/persistence/PostgresErrors.hpp"
#include "adapters/secondary/persistence/PostgresSchema.hpp"

#include <iostream>
#include <utility>

namespace inventory::adapters::secondary {

PostgresUnitOfWork::PostgresUnitOfWork(const std::string& connectionString)
    : conn_(connectionString)
    , txn_(conn_)
    , catalog_(txn_)
    , balances_(txn_)
    , layers_(txn_)
    , movements_(txn_)
    , transfers_(txn_)
    , reservations_(txn_)
{
}

void PostgresUnitOfWork::commit() {
    withPgErrors("commit", [&] { txn_.commit(); });
}

PostgresUnitOfWorkFactory::PostgresUnitOfWorkFactory(std::shared_ptr<settings::DbSettings> settings)
    : settings_(std::move(settings))
{
    initSchema();
    std::cout << "[PostgresUnitOfWorkFactory] Connected to " << settings_->getName()
              << " at " << settings_->getHost() << ":" << settings_->getPort() << std::endl;
}

std::unique_ptr<ports::output::IUnitOfWork> PostgresUnitOfWorkFactory::begin() {
    return withPgErrors("begin", [&] {
        return std::make_unique<PostgresUnitOfWork>(settings_->getConnectionString());
    });
}

void PostgresUnitOfWorkFactory::initSchema() {
    withPgErrors("initSchema", [&] {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);
        txn.exec(INVENTORY_SCHEMA);
        txn.commit();
    });
    std::cout << "[PostgresUnitOfWorkFactory] Schema initialized" << std::endl;
}

} // namespace inventory::adapters::secondary
