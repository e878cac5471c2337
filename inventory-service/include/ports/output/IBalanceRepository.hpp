#pragma once

#include "domain/Balance.hpp"
#include "domain/BalanceSummary.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::output {

/**
 * @brief Хранилище остатков
 *
 * Инкременты атомарны на уровне строки (upsert с прибавлением),
 * никакого read-modify-write на стороне приложения.
 */
class IBalanceRepository {
public:
    virtual ~IBalanceRepository() = default;

    virtual std::optional<domain::Balance> find(
        const std::string& tenantId, const std::string& productId, const std::string& locationId) = 0;

    /**
     * @brief Заблокировать существующие строки остатков до конца транзакции
     *
     * Строки блокируются в порядке productId. Отсутствующие строки не возвращаются.
     */
    virtual std::vector<domain::Balance> lockForUpdate(
        const std::string& tenantId, const std::string& locationId,
        const std::vector<std::string>& productIds) = 0;

    /// Создаёт строку с onHand = max(0, delta) или прибавляет delta
    virtual void incrementOnHand(
        const std::string& tenantId, const std::string& productId,
        const std::string& locationId, int64_t delta) = 0;

    /// Создаёт строку с reserved = max(0, delta) или прибавляет delta
    virtual void incrementReserved(
        const std::string& tenantId, const std::string& productId,
        const std::string& locationId, int64_t delta) = 0;

    virtual std::vector<domain::Balance> findByProduct(
        const std::string& tenantId, const std::string& productId) = 0;

    virtual std::vector<domain::Balance> findByLocation(
        const std::string& tenantId, const std::string& locationId) = 0;

    /**
     * @brief Остатки ниже уровня дозаказа (reorderLevel > 0, товар не удалён)
     *
     * Отсортированы по убыванию нехватки.
     */
    virtual std::vector<domain::LowStockLine> findBelowReorderLevel(
        const std::string& tenantId, const std::optional<std::string>& locationId) = 0;
};

} // namespace inventory::ports::output
