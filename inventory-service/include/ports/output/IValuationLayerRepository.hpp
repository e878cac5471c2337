#pragma once

#include "domain/ValuationLayer.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace inventory::ports::output {

enum class LayerOrder {
    OLDEST_FIRST,
    NEWEST_FIRST
};

/**
 * @brief Слои себестоимости и аудит их списаний
 */
class IValuationLayerRepository {
public:
    virtual ~IValuationLayerRepository() = default;

    virtual void insert(const domain::ValuationLayer& layer) = 0;

    /**
     * @brief Слои с remainingQty > 0, заблокированные до конца транзакции
     *
     * Порядок по createdAt, при равенстве - по порядку вставки.
     */
    virtual std::vector<domain::ValuationLayer> findOpenForUpdate(
        const std::string& tenantId, const std::string& productId,
        const std::string& locationId, LayerOrder order) = 0;

    /// Все слои ключа, включая исчерпанные, от старых к новым
    virtual std::vector<domain::ValuationLayer> findAll(
        const std::string& tenantId, const std::string& productId, const std::string& locationId) = 0;

    virtual std::vector<domain::ValuationLayer> findOpenByTenant(const std::string& tenantId) = 0;

    virtual int64_t sumRemaining(
        const std::string& tenantId, const std::string& productId, const std::string& locationId) = 0;

    virtual void decrementRemaining(const std::string& layerId, int64_t quantity) = 0;

    virtual void insertConsumptions(const std::vector<domain::ValuationLayerConsumption>& consumptions) = 0;

    virtual std::vector<domain::ValuationLayerConsumption> findConsumptionsByMovement(
        const std::string& movementId) = 0;
};

} // namespace inventory::ports::output
