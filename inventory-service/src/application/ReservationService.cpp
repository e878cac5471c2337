#include "application/ReservationService.hpp"
#include "application/ReservationExpiryHandler.hpp"
#include "domain/exceptions/InventoryException.hpp"
#include "utils/UuidGenerator.hpp"

#include <iostream>
#include <sstream>
#include <utility>

namespace inventory::application {

using domain::ReservationStatus;
using domain::StockReservation;
using ports::output::IUnitOfWork;

ReservationService::ReservationService(
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory,
    std::shared_ptr<StockValidator> validator,
    std::shared_ptr<BalanceTracker> balances,
    std::shared_ptr<ports::output::IJobScheduler> scheduler
) : uowFactory_(std::move(uowFactory))
  , validator_(std::move(validator))
  , balances_(std::move(balances))
  , scheduler_(std::move(scheduler))
{
    std::cout << "[ReservationService] Created" << std::endl;
}

StockReservation ReservationService::create(
    const std::string& tenantId, const std::string& userId,
    const domain::CreateReservationRequest& request)
{
    if (request.quantity <= 0) {
        throw domain::BadRequestException("Reservation quantity must be positive");
    }
    if (request.expiresAt <= domain::Timestamp::now()) {
        throw domain::BadRequestException("Expiration time must be in the future");
    }

    StockReservation reservation;
    {
        auto uow = uowFactory_->begin();
        validator_->validateProducts(*uow, tenantId, {request.productId});
        validator_->validateLocation(*uow, tenantId, request.locationId);
        requireAvailable(*uow, tenantId, request.productId, request.locationId, request.quantity);

        reservation.id = utils::UuidGenerator::generate();
        reservation.tenantId = tenantId;
        reservation.productId = request.productId;
        reservation.locationId = request.locationId;
        reservation.quantity = request.quantity;
        reservation.expiresAt = request.expiresAt;
        reservation.status = ReservationStatus::ACTIVE;
        reservation.referenceType = request.referenceType;
        reservation.referenceId = request.referenceId;
        reservation.createdById = userId;
        reservation.createdAt = domain::Timestamp::now();

        uow->reservations().insert(reservation);
        balances_->updateReserved(*uow, request.productId, request.locationId, tenantId, request.quantity);
        uow->commit();
    }

    std::cout << "[ReservationService] Reserved " << reservation.quantity << " unit(s) of "
              << reservation.productId << " at " << reservation.locationId
              << " until " << reservation.expiresAt.toString() << " (" << reservation.id << ")" << std::endl;

    scheduleExpiry(reservation, false);
    return reservation;
}

StockReservation ReservationService::update(
    const std::string& tenantId, const std::string& reservationId,
    const domain::UpdateReservationRequest& request)
{
    if (request.empty()) {
        throw domain::BadRequestException("At least one field must be provided for update");
    }
    if (request.quantity && *request.quantity <= 0) {
        throw domain::BadRequestException("Reservation quantity must be positive");
    }
    if (request.expiresAt && *request.expiresAt <= domain::Timestamp::now()) {
        throw domain::BadRequestException("Expiration time must be in the future");
    }

    StockReservation reservation;
    bool expiryChanged = false;
    {
        auto uow = uowFactory_->begin();
        reservation = lockActive(*uow, tenantId, reservationId);

        if (request.quantity && *request.quantity != reservation.quantity) {
            int64_t delta = *request.quantity - reservation.quantity;
            if (delta > 0) {
                requireAvailable(*uow, tenantId, reservation.productId, reservation.locationId, delta);
            }
            balances_->updateReserved(*uow, reservation.productId, reservation.locationId, tenantId, delta);
            reservation.quantity = *request.quantity;
        }
        if (request.expiresAt && *request.expiresAt != reservation.expiresAt) {
            reservation.expiresAt = *request.expiresAt;
            expiryChanged = true;
        }
        if (request.referenceType) {
            reservation.referenceType = request.referenceType;
        }
        if (request.referenceId) {
            reservation.referenceId = request.referenceId;
        }

        uow->reservations().update(reservation);
        uow->commit();
    }

    std::cout << "[ReservationService] Updated " << reservationId << ": quantity "
              << reservation.quantity << ", expires " << reservation.expiresAt.toString() << std::endl;

    if (expiryChanged) {
        scheduleExpiry(reservation, true);
    }
    return reservation;
}

void ReservationService::release(const std::string& tenantId, const std::string& reservationId) {
    StockReservation reservation;
    {
        auto uow = uowFactory_->begin();
        reservation = lockActive(*uow, tenantId, reservationId);

        reservation.status = ReservationStatus::RELEASED;
        uow->reservations().update(reservation);
        balances_->updateReserved(*uow, reservation.productId, reservation.locationId,
                                  tenantId, -reservation.quantity);
        uow->commit();
    }

    std::cout << "[ReservationService] Released " << reservationId << " ("
              << reservation.quantity << " unit(s))" << std::endl;

    try {
        scheduler_->cancel(ReservationExpiryHandler::jobKey(reservationId));
    } catch (const std::exception& e) {
        // Оставшаяся задача найдёт резерв RELEASED и ничего не сделает
        std::cerr << "[ReservationService] Failed to cancel expiry job for "
                  << reservationId << ": " << e.what() << std::endl;
    }
}

StockReservation ReservationService::findOne(const std::string& tenantId, const std::string& reservationId) {
    auto uow = uowFactory_->begin();
    auto reservation = uow->reservations().findById(tenantId, reservationId);
    if (!reservation) {
        throw domain::NotFoundException("Reservation not found: " + reservationId);
    }
    return *reservation;
}

size_t ReservationService::recoverExpiryJobs() {
    std::vector<StockReservation> active;
    {
        auto uow = uowFactory_->begin();
        active = uow->reservations().findAllActive();
    }

    size_t scheduled = 0;
    for (const auto& reservation : active) {
        if (scheduler_->scheduleOnce(ReservationExpiryHandler::jobKey(reservation.id),
                                     ReservationExpiryHandler::JOB_NAME,
                                     reservation.expiresAt,
                                     ReservationExpiryHandler::payload(reservation))) {
            ++scheduled;
        }
    }

    std::cout << "[ReservationService] Recovered " << scheduled << " expiry job(s) for "
              << active.size() << " active reservation(s)" << std::endl;
    return scheduled;
}

void ReservationService::scheduleExpiry(const StockReservation& reservation, bool replace) {
    auto key = ReservationExpiryHandler::jobKey(reservation.id);
    auto body = ReservationExpiryHandler::payload(reservation);
    try {
        if (replace) {
            scheduler_->reschedule(key, ReservationExpiryHandler::JOB_NAME, reservation.expiresAt, body);
        } else {
            scheduler_->scheduleOnce(key, ReservationExpiryHandler::JOB_NAME, reservation.expiresAt, body);
        }
    } catch (const std::exception& e) {
        std::cerr << "[ReservationService] Failed to schedule expiry for "
                  << reservation.id << ": " << e.what() << std::endl;
        throw domain::TransientException(
            "Reservation " + reservation.id + " saved but expiry scheduling failed: " + e.what());
    }
}

StockReservation ReservationService::lockActive(IUnitOfWork& uow,
                                                const std::string& tenantId, const std::string& reservationId)
{
    auto reservation = uow.reservations().findForUpdate(tenantId, reservationId);
    if (!reservation) {
        throw domain::NotFoundException("Reservation not found: " + reservationId);
    }
    if (!reservation->isActive()) {
        throw domain::ConflictException(
            "Reservation " + reservationId + " is " + domain::toString(reservation->status));
    }
    return *reservation;
}

void ReservationService::requireAvailable(IUnitOfWork& uow, const std::string& tenantId,
                                          const std::string& productId, const std::string& locationId,
                                          int64_t quantity)
{
    auto availability = validator_->getAvailability(uow, tenantId, locationId, productId);
    if (availability.available < quantity) {
        std::ostringstream msg;
        msg << "Insufficient available stock. On-hand: " << availability.onHand
            << ", Reserved: " << availability.reserved
            << ", Available: " << availability.available
            << ", Requested: " << quantity;
        throw domain::BadRequestException(msg.str());
    }
}

} // namespace inventory::application
