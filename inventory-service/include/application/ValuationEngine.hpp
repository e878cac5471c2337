#pragma once

#include "domain/Money.hpp"
#include "domain/ValuationLayer.hpp"
#include "domain/ValuationReport.hpp"
#include "domain/enums/PricingMethod.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace inventory::application {

/**
 * @brief Параметры нового слоя себестоимости
 */
struct NewLayer {
    std::string productId;
    std::string locationId;
    std::string tenantId;
    int64_t quantity = 0;
    domain::Money unitCost;
    std::string sourceMovementId;
    std::optional<std::string> batchId;
};

/**
 * @brief Движок оценки: слои себестоимости FIFO / LIFO / MOVING_AVERAGE
 *
 * Все мутирующие методы работают внутри переданной единицы работы,
 * в той же транзакции, что и изменение остатка по ключу.
 */
class ValuationEngine {
public:
    explicit ValuationEngine(std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory);

    /**
     * @brief Метод оценки: товар -> тенант -> FIFO
     *
     * Никогда не бросает: неизвестный товар даёт FIFO.
     */
    domain::PricingMethod resolvePricingMethod(
        ports::output::IUnitOfWork& uow, const std::string& productId, const std::string& tenantId);

    /**
     * @brief Создать слой с remainingQty = originalQty = quantity
     * @throws BadRequestException при quantity <= 0 или unitCost < 0
     */
    domain::ValuationLayer createLayer(ports::output::IUnitOfWork& uow, const NewLayer& request);

    /**
     * @brief Списать quantity со слоёв в порядке метода
     *
     * Если слоёв не хватает, списание просто останавливается: достаточность
     * остатка проверяет StockValidator до вызова.
     * Для MOVING_AVERAGE цена всех единиц - WAC до начала списания,
     * сами слои уменьшаются в порядке FIFO.
     */
    domain::LayerConsumptionResult consumeLayers(
        ports::output::IUnitOfWork& uow,
        const std::string& productId, const std::string& locationId, const std::string& tenantId,
        int64_t quantity, domain::PricingMethod method);

    /// Σ(unitCost × remainingQty) / Σ(remainingQty), 0 без слоёв
    domain::Money calculateWAC(
        ports::output::IUnitOfWork& uow,
        const std::string& productId, const std::string& locationId, const std::string& tenantId);

    void createConsumptionRecords(
        ports::output::IUnitOfWork& uow, const std::string& movementId,
        const std::vector<domain::LayerConsumption>& consumptions);

    /// Сумма remainingQty; сверка с Balance.onHandQuantity
    int64_t getAvailableQuantity(
        ports::output::IUnitOfWork& uow,
        const std::string& productId, const std::string& locationId, const std::string& tenantId);

    domain::ValuationReport getValuationReport(const std::string& tenantId);

private:
    std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory_;

    static domain::Money weightedAverage(const std::vector<domain::ValuationLayer>& layers);
};

} // namespace inventory::application
