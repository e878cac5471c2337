#pragma once

#include "domain/Catalog.hpp"
#include "domain/MovementRequest.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace inventory::application {

struct Availability {
    int64_t onHand = 0;
    int64_t reserved = 0;
    int64_t available = 0;
};

/**
 * @brief Проверки перед изменением остатков
 *
 * Читает данные внутри той же единицы работы, что и последующая запись,
 * поэтому проверка и изменение не разделены чужими транзакциями.
 */
class StockValidator {
public:
    StockValidator();

    /**
     * @throws NotFoundException перечисляя отсутствующие ID
     * @throws BadRequestException если среди товаров есть VARIABLE (родительский SKU)
     */
    void validateProducts(ports::output::IUnitOfWork& uow,
                          const std::string& tenantId, const std::vector<std::string>& productIds);

    /// @throws NotFoundException для отсутствующего или неактивного склада
    domain::Location validateLocation(ports::output::IUnitOfWork& uow,
                                      const std::string& tenantId, const std::string& locationId);

    std::map<std::string, domain::Location> validateLocations(
        ports::output::IUnitOfWork& uow,
        const std::string& tenantId, const std::vector<std::string>& locationIds);

    /**
     * @brief available = onHand - reserved по каждой позиции
     *
     * Строки остатков блокируются одним запросом. Количества одного товара
     * из нескольких строк суммируются.
     * @throws BadRequestException по первой позиции с нехваткой
     */
    void validateStockAvailability(ports::output::IUnitOfWork& uow,
                                   const std::string& tenantId, const std::string& locationId,
                                   const std::vector<domain::StockLine>& items);

    Availability getAvailability(ports::output::IUnitOfWork& uow,
                                 const std::string& tenantId, const std::string& locationId,
                                 const std::string& productId);
};

} // namespace inventory::application
