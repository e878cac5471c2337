#pragma once

#include "application/MovementService.hpp"
#include "application/StockValidator.hpp"
#include "application/ValuationEngine.hpp"
#include "ports/input/ITransferService.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include <memory>
#include <optional>
#include <string>

namespace inventory::application {

/**
 * @brief Перемещения между складами
 *
 * DRAFT -> IN_TRANSIT -> COMPLETED, отмена из DRAFT и IN_TRANSIT.
 * Каждый переход блокирует строку перемещения, повторная отгрузка
 * или двойной откат невозможны.
 *
 * Цена отгрузки (WAC источника) фиксируется в строке и дальше
 * не пересчитывается: приёмка и отмена используют сохранённое значение.
 */
class TransferService : public ports::input::ITransferService {
public:
    TransferService(
        std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory,
        std::shared_ptr<StockValidator> validator,
        std::shared_ptr<ValuationEngine> valuation,
        std::shared_ptr<MovementService> movements
    );

    /**
     * @brief Создать DRAFT-перемещение с номером TRF-<год>-NNNN
     *
     * При shipImmediately отгрузка выполняется в той же транзакции.
     */
    domain::CreateTransferResult create(
        const std::string& tenantId, const std::string& userId,
        const domain::CreateTransferRequest& request) override;

    /// @throws ConflictException если статус не DRAFT
    domain::StockTransfer ship(
        const std::string& tenantId, const std::string& userId,
        const std::string& transferId, const std::optional<std::string>& note = std::nullopt) override;

    /**
     * @brief Приёмка: каждая строка должна быть в запросе
     *
     * Недостача (shipped - received > 0) требует причину. Недостающие
     * единицы из учёта выбывают и нигде не приходуются.
     */
    domain::StockTransfer receive(
        const std::string& tenantId, const std::string& userId,
        const std::string& transferId, const domain::ReceiveTransferRequest& request) override;

    domain::StockTransfer cancel(
        const std::string& tenantId, const std::string& userId, const std::string& transferId) override;

    domain::StockTransfer findOne(const std::string& tenantId, const std::string& transferId) override;

    static std::string formatTransferNumber(int year, int64_t sequence);

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;
    std::shared_ptr<StockValidator> validator_;
    std::shared_ptr<ValuationEngine> valuation_;
    std::shared_ptr<MovementService> movements_;

    domain::StockTransfer lockTransfer(ports::output::IUnitOfWork& uow,
                                       const std::string& tenantId, const std::string& transferId);

    void shipInTransaction(ports::output::IUnitOfWork& uow, domain::StockTransfer& transfer,
                           const std::string& userId, const std::optional<std::string>& note);
};

} // namespace inventory::application
