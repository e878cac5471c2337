#pragma once

#include "application/BalanceTracker.hpp"
#include "application/StockValidator.hpp"
#include "application/ValuationEngine.hpp"
#include "ports/input/IMovementService.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include <memory>
#include <optional>
#include <string>

namespace inventory::application {

/**
 * @brief Общие поля движения, которые задаёт вызывающая операция
 */
struct MovementContext {
    std::string tenantId;
    std::string userId;
    std::string locationId;
    domain::ReferenceType referenceType = domain::ReferenceType::PURCHASE;
    std::optional<std::string> referenceId;
    std::optional<std::string> note;
    std::optional<std::string> transferId;
};

/**
 * @brief Результат одного списания
 */
struct OutboundRecord {
    domain::StockMovement movement;
    domain::LayerConsumptionResult consumption;
};

/**
 * @brief Сервис движений: приход, расход, корректировка
 *
 * Оркестрирует StockValidator -> ValuationEngine -> BalanceTracker
 * в одной единице работы. recordInbound/recordOutbound открыты для
 * TransferService и работают в чужой единице работы.
 */
class MovementService : public ports::input::IMovementService {
public:
    MovementService(
        std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory,
        std::shared_ptr<StockValidator> validator,
        std::shared_ptr<ValuationEngine> valuation,
        std::shared_ptr<BalanceTracker> balances
    );

    domain::StockInResult stockIn(
        const std::string& tenantId, const std::string& userId,
        const domain::StockInRequest& request) override;

    domain::StockOutResult stockOut(
        const std::string& tenantId, const std::string& userId,
        const domain::StockOutRequest& request) override;

    domain::AdjustResult adjust(
        const std::string& tenantId, const std::string& userId,
        const domain::AdjustRequest& request) override;

    /// @throws NotFoundException
    domain::MovementDetail findOne(const std::string& tenantId, const std::string& movementId) override;

    /**
     * @brief IN-движение + слой + onHand += quantity
     */
    domain::StockMovement recordInbound(
        ports::output::IUnitOfWork& uow, const MovementContext& context,
        const std::string& productId, int64_t quantity, const domain::Money& unitCost,
        const std::optional<std::string>& batchId = std::nullopt);

    /**
     * @brief Списание слоёв + OUT-движение + аудит списаний + onHand -= quantity
     *
     * fixedUnitCost задаёт цену движения вместо фактической стоимости
     * списанных слоёв (отгрузка перемещения по WAC).
     */
    OutboundRecord recordOutbound(
        ports::output::IUnitOfWork& uow, const MovementContext& context,
        const std::string& productId, int64_t quantity,
        const std::optional<domain::Money>& fixedUnitCost = std::nullopt);

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;
    std::shared_ptr<StockValidator> validator_;
    std::shared_ptr<ValuationEngine> valuation_;
    std::shared_ptr<BalanceTracker> balances_;

    static void requirePositive(const std::string& productId, int64_t quantity);
};

} // namespace inventory::application
