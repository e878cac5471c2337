#pragma once

#include "domain/Balance.hpp"
#include "domain/BalanceSummary.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace inventory::application {

/**
 * @brief Остатки onHand / reserved по ключу (тенант, товар, склад)
 */
class BalanceTracker {
public:
    explicit BalanceTracker(std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory);

    /**
     * @brief Изменить onHandQuantity на delta (delta может быть < 0)
     *
     * Строка создаётся с onHand = max(0, delta), если её нет.
     */
    void updateBalance(ports::output::IUnitOfWork& uow,
                       const std::string& productId, const std::string& locationId,
                       const std::string& tenantId, int64_t delta);

    /// То же для reservedQuantity
    void updateReserved(ports::output::IUnitOfWork& uow,
                        const std::string& productId, const std::string& locationId,
                        const std::string& tenantId, int64_t delta);

    /// Текущий остаток; отсутствующая строка - нулевой остаток
    domain::Balance getBalance(const std::string& tenantId,
                               const std::string& productId, const std::string& locationId);

    /**
     * @brief Остатки товара по всем складам
     * @throws NotFoundException если товара нет у тенанта
     */
    domain::ProductBalanceSummary getProductSummary(const std::string& tenantId, const std::string& productId);

    /**
     * @brief Остатки всех товаров на складе
     * @throws NotFoundException если склада нет у тенанта
     */
    domain::LocationBalanceSummary getLocationSummary(const std::string& tenantId, const std::string& locationId);

    /// Товары ниже уровня дозаказа, по убыванию нехватки; locationId сужает выборку
    std::vector<domain::LowStockLine> getLowStock(const std::string& tenantId,
                                                  const std::optional<std::string>& locationId = std::nullopt);

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;
};

} // namespace inventory::application
