#pragma once

#include "domain/ReservationRequest.hpp"
#include "domain/StockReservation.hpp"
#include <string>

namespace inventory::ports::input {

class IReservationService {
public:
    virtual ~IReservationService() = default;

    virtual domain::StockReservation create(
        const std::string& tenantId, const std::string& userId,
        const domain::CreateReservationRequest& request) = 0;

    virtual domain::StockReservation update(
        const std::string& tenantId, const std::string& reservationId,
        const domain::UpdateReservationRequest& request) = 0;

    virtual void release(const std::string& tenantId, const std::string& reservationId) = 0;

    virtual domain::StockReservation findOne(const std::string& tenantId, const std::string& reservationId) = 0;
};

} // namespace inventory::ports::input
