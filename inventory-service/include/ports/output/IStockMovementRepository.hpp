#pragma once

#include "domain/StockMovement.hpp"
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::output {

/**
 * @brief Журнал движений (только вставка и чтение)
 */
class IStockMovementRepository {
public:
    virtual ~IStockMovementRepository() = default;

    virtual void insert(const domain::StockMovement& movement) = 0;

    virtual std::optional<domain::StockMovement> findById(
        const std::string& tenantId, const std::string& movementId) = 0;

    virtual std::vector<domain::StockMovement> findByTransfer(
        const std::string& tenantId, const std::string& transferId) = 0;
};

} // namespace inventory::ports::output
