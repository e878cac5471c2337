#pragma once

#include "domain/StockReservation.hpp"
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::output {

class IStockReservationRepository {
public:
    virtual ~IStockReservationRepository() = default;

    virtual void insert(const domain::StockReservation& reservation) = 0;

    virtual std::optional<domain::StockReservation> findById(
        const std::string& tenantId, const std::string& reservationId) = 0;

    virtual std::optional<domain::StockReservation> findForUpdate(
        const std::string& tenantId, const std::string& reservationId) = 0;

    virtual void update(const domain::StockReservation& reservation) = 0;

    /// ACTIVE-резервы всех тенантов (восстановление задач истечения)
    virtual std::vector<domain::StockReservation> findAllActive() = 0;
};

} // namespace inventory::ports::output
