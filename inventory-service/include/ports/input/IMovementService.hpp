#pragma once

#include "domain/MovementRequest.hpp"
#include "domain/MovementResult.hpp"
#include "domain/StockMovement.hpp"
#include <string>

namespace inventory::ports::input {

/**
 * @brief Приход, расход и корректировка остатков
 *
 * Каждый вызов - одна транзакция: либо все движения, либо ни одного.
 * Повтор вызова создаёт новые движения, дедупликация по referenceId - выше.
 */
class IMovementService {
public:
    virtual ~IMovementService() = default;

    virtual domain::StockInResult stockIn(
        const std::string& tenantId, const std::string& userId,
        const domain::StockInRequest& request) = 0;

    virtual domain::StockOutResult stockOut(
        const std::string& tenantId, const std::string& userId,
        const domain::StockOutRequest& request) = 0;

    virtual domain::AdjustResult adjust(
        const std::string& tenantId, const std::string& userId,
        const domain::AdjustRequest& request) = 0;

    virtual domain::MovementDetail findOne(const std::string& tenantId, const std::string& movementId) = 0;
};

} // namespace inventory::ports::input
