#pragma once

#include "application/BalanceTracker.hpp"
#include "domain/StockReservation.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include <memory>
#include <string>

namespace inventory::application {

enum class ExpiryOutcome {
    EXPIRED,
    NOT_FOUND,
    ALREADY_RESOLVED,
    NOT_DUE
};

std::string toString(ExpiryOutcome outcome);

/**
 * @brief Обработчик задачи истечения резерва
 *
 * Доставка at-least-once: повтор, опоздание и срабатывание после
 * release обрабатываются как no-op. Исключения (недоступность БД)
 * пробрасываются планировщику для повтора.
 */
class ReservationExpiryHandler {
public:
    static constexpr const char* JOB_NAME = "reservation.expire";

    ReservationExpiryHandler(
        std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory,
        std::shared_ptr<BalanceTracker> balances
    );

    /// Уникальный ключ задачи резерва
    static std::string jobKey(const std::string& reservationId);

    /// {"reservationId": ..., "tenantId": ...}
    static std::string payload(const domain::StockReservation& reservation);

    ExpiryOutcome handle(const std::string& tenantId, const std::string& reservationId);

    /// @throws BadRequestException если payload не разбирается
    ExpiryOutcome handlePayload(const std::string& payload);

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;
    std::shared_ptr<BalanceTracker> balances_;
};

} // namespace inventory::application
