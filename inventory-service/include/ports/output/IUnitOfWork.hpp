#pragma once

#include "ports/output/IBalanceRepository.hpp"
#include "ports/output/ICatalogRepository.hpp"
#include "ports/output/IStockMovementRepository.hpp"
#include "ports/output/IStockReservationRepository.hpp"
#include "ports/output/IStockTransferRepository.hpp"
#include "ports/output/IValuationLayerRepository.hpp"
#include <memory>

namespace inventory::ports::output {

/**
 * @brief Единица работы: все репозитории в одной транзакции
 *
 * commit() вызывается ровно один раз на границе операции.
 * Уничтожение без commit() откатывает все изменения.
 */
class IUnitOfWork {
public:
    virtual ~IUnitOfWork() = default;

    virtual ICatalogRepository& catalog() = 0;
    virtual IBalanceRepository& balances() = 0;
    virtual IValuationLayerRepository& layers() = 0;
    virtual IStockMovementRepository& movements() = 0;
    virtual IStockTransferRepository& transfers() = 0;
    virtual IStockReservationRepository& reservations() = 0;

    virtual void commit() = 0;
};

class IUnitOfWorkFactory {
public:
    virtual ~IUnitOfWorkFactory() = default;

    /// Открыть транзакцию
    virtual std::unique_ptr<IUnitOfWork> begin() = 0;
};

} // namespace inventory::ports::output
