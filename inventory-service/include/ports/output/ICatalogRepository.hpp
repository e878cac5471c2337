#pragma once

#include "domain/Catalog.hpp"
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::output {

/**
 * @brief Каталог товаров и складов (только чтение)
 *
 * Принадлежит другому модулю, ядро лишь проверяет существование
 * и читает метод оценки.
 */
class ICatalogRepository {
public:
    virtual ~ICatalogRepository() = default;

    /// Неудалённые товары тенанта из списка
    virtual std::vector<domain::Product> findProducts(
        const std::string& tenantId, const std::vector<std::string>& productIds) = 0;

    virtual std::optional<domain::Product> findProduct(
        const std::string& tenantId, const std::string& productId) = 0;

    /// Склады тенанта из списка, включая неактивные
    virtual std::vector<domain::Location> findLocations(
        const std::string& tenantId, const std::vector<std::string>& locationIds) = 0;

    virtual std::optional<domain::PricingMethod> findTenantPricingMethod(const std::string& tenantId) = 0;
};

} // namespace inventory::ports::output
