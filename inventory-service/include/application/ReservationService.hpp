#pragma once

#include "application/BalanceTracker.hpp"
#include "application/StockValidator.hpp"
#include "ports/input/IReservationService.hpp"
#include "ports/output/IJobScheduler.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include <cstddef>
#include <memory>
#include <string>

namespace inventory::application {

/**
 * @brief Резервы остатка с жёстким сроком истечения
 *
 * Запись резерва и reservedQuantity меняются в одной транзакции.
 * Задача истечения ставится в планировщик после commit, ключ задачи
 * однозначно определяется ID резерва.
 */
class ReservationService : public ports::input::IReservationService {
public:
    ReservationService(
        std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory,
        std::shared_ptr<StockValidator> validator,
        std::shared_ptr<BalanceTracker> balances,
        std::shared_ptr<ports::output::IJobScheduler> scheduler
    );

    /**
     * @throws BadRequestException при нехватке доступного остатка или expiresAt <= now
     * @throws TransientException если задачу истечения не удалось запланировать
     */
    domain::StockReservation create(
        const std::string& tenantId, const std::string& userId,
        const domain::CreateReservationRequest& request) override;

    /**
     * @brief Частичное обновление ACTIVE-резерва
     *
     * Рост количества проверяется только на дельту. Новый expiresAt
     * перепланирует задачу (cancel + scheduleOnce).
     */
    domain::StockReservation update(
        const std::string& tenantId, const std::string& reservationId,
        const domain::UpdateReservationRequest& request) override;

    void release(const std::string& tenantId, const std::string& reservationId) override;

    domain::StockReservation findOne(const std::string& tenantId, const std::string& reservationId) override;

    /**
     * @brief Поставить задачи истечения для всех ACTIVE-резервов
     *
     * Вызывается при старте воркера. Просроченные срабатывают сразу.
     * @return число запланированных задач
     */
    size_t recoverExpiryJobs();

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;
    std::shared_ptr<StockValidator> validator_;
    std::shared_ptr<BalanceTracker> balances_;
    std::shared_ptr<ports::output::IJobScheduler> scheduler_;

    void scheduleExpiry(const domain::StockReservation& reservation, bool replace);

    domain::StockReservation lockActive(ports::output::IUnitOfWork& uow,
                                        const std::string& tenantId, const std::string& reservationId);

    void requireAvailable(ports::output::IUnitOfWork& uow, const std::string& tenantId,
                          const std::string& productId, const std::string& locationId, int64_t quantity);
};

} // namespace inventory::application
