#include "application/ReservationExpiryHandler.hpp"
#include "domain/exceptions/InventoryException.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace inventory::application {

std::string toString(ExpiryOutcome outcome) {
    switch (outcome) {
        case ExpiryOutcome::EXPIRED: return "EXPIRED";
        case ExpiryOutcome::NOT_FOUND: return "NOT_FOUND";
        case ExpiryOutcome::ALREADY_RESOLVED: return "ALREADY_RESOLVED";
        case ExpiryOutcome::NOT_DUE: return "NOT_DUE";
        default: return "UNKNOWN";
    }
}

ReservationExpiryHandler::ReservationExpiryHandler(
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory,
    std::shared_ptr<BalanceTracker> balances
) : uowFactory_(std::move(uowFactory))
  , balances_(std::move(balances))
{
    std::cout << "[ReservationExpiryHandler] Created" << std::endl;
}

std::string ReservationExpiryHandler::jobKey(const std::string& reservationId) {
    return "expire-" + reservationId;
}

std::string ReservationExpiryHandler::payload(const domain::StockReservation& reservation) {
    nlohmann::json body;
    body["reservationId"] = reservation.id;
    body["tenantId"] = reservation.tenantId;
    return body.dump();
}

ExpiryOutcome ReservationExpiryHandler::handle(const std::string& tenantId, const std::string& reservationId) {
    auto uow = uowFactory_->begin();
    auto reservation = uow->reservations().findForUpdate(tenantId, reservationId);

    if (!reservation) {
        std::cout << "[ReservationExpiryHandler] Reservation " << reservationId
                  << " not found, nothing to expire" << std::endl;
        return ExpiryOutcome::NOT_FOUND;
    }
    if (!reservation->isActive()) {
        std::cout << "[ReservationExpiryHandler] Reservation " << reservationId << " already "
                  << domain::toString(reservation->status) << std::endl;
        return ExpiryOutcome::ALREADY_RESOLVED;
    }
    if (reservation->expiresAt > domain::Timestamp::now()) {
        // Срок перенесён или часы разошлись: задача на новый срок уже запланирована
        std::cout << "[ReservationExpiryHandler] Reservation " << reservationId
                  << " not due until " << reservation->expiresAt.toString() << std::endl;
        return ExpiryOutcome::NOT_DUE;
    }

    reservation->status = domain::ReservationStatus::EXPIRED;
    uow->reservations().update(*reservation);
    balances_->updateReserved(*uow, reservation->productId, reservation->locationId,
                              tenantId, -reservation->quantity);
    uow->commit();

    std::cout << "[ReservationExpiryHandler] Reservation " << reservationId << " expired, released "
              << reservation->quantity << " unit(s)" << std::endl;
    return ExpiryOutcome::EXPIRED;
}

ExpiryOutcome ReservationExpiryHandler::handlePayload(const std::string& payload) {
    std::string tenantId;
    std::string reservationId;
    try {
        auto body = nlohmann::json::parse(payload);
        tenantId = body.at("tenantId").get<std::string>();
        reservationId = body.at("reservationId").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw domain::BadRequestException(std::string("Invalid expiry payload: ") + e.what());
    }
    return handle(tenantId, reservationId);
}

} // namespace inventory::application
