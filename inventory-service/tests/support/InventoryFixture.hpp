#pragma once

#include "adapters/secondary/persistence/InMemoryUnitOfWork.hpp"
#include "application/BalanceTracker.hpp"
#include "application/MovementService.hpp"
#include "application/StockValidator.hpp"
#include "application/ValuationEngine.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace inventory::tests {

/**
 * @brief Общая база для тестов сервисов на in-memory хранилище
 *
 * Каталог tenant-1:
 * - p-fifo   "Widget FIFO"  (метод тенанта, по умолчанию FIFO)
 * - p-lifo   "Widget LIFO"  (LIFO)
 * - p-avg    "Widget AVG"   (MOVING_AVERAGE)
 * - p-parent "T-Shirt"      (VARIABLE)
 * - p-gone   "Discontinued" (удалён)
 * - склады loc-a, loc-b (активные), loc-c (неактивный)
 * tenant-2: p-other, loc-other
 */
class InventoryFixture : public ::testing::Test {
protected:
    static constexpr const char* TENANT = "tenant-1";
    static constexpr const char* OTHER_TENANT = "tenant-2";
    static constexpr const char* USER = "user-1";

    static constexpr const char* FIFO = "p-fifo";
    static constexpr const char* LIFO = "p-lifo";
    static constexpr const char* AVG = "p-avg";
    static constexpr const char* PARENT = "p-parent";
    static constexpr const char* GONE = "p-gone";
    static constexpr const char* OTHER_PRODUCT = "p-other";

    static constexpr const char* LOC_A = "loc-a";
    static constexpr const char* LOC_B = "loc-b";
    static constexpr const char* LOC_INACTIVE = "loc-c";
    static constexpr const char* OTHER_LOCATION = "loc-other";

    void SetUp() override {
        store_ = std::make_shared<adapters::secondary::InMemoryStore>();
        seedCatalog();

        factory_ = std::make_shared<adapters::secondary::InMemoryUnitOfWorkFactory>(store_);
        validator_ = std::make_shared<application::StockValidator>();
        valuation_ = std::make_shared<application::ValuationEngine>(factory_);
        balances_ = std::make_shared<application::BalanceTracker>(factory_);
        movements_ = std::make_shared<application::MovementService>(factory_, validator_, valuation_, balances_);
    }

    void seedCatalog() {
        addProduct(TENANT, FIFO, "Widget FIFO", domain::ProductType::SIMPLE, std::nullopt);
        addProduct(TENANT, LIFO, "Widget LIFO", domain::ProductType::SIMPLE, domain::PricingMethod::LIFO);
        addProduct(TENANT, AVG, "Widget AVG", domain::ProductType::VARIANT, domain::PricingMethod::MOVING_AVERAGE);
        addProduct(TENANT, PARENT, "T-Shirt", domain::ProductType::VARIABLE, std::nullopt);
        addProduct(TENANT, GONE, "Discontinued", domain::ProductType::SIMPLE, std::nullopt, true);
        addProduct(OTHER_TENANT, OTHER_PRODUCT, "Foreign", domain::ProductType::SIMPLE, std::nullopt);

        addLocation(TENANT, LOC_A, "Warehouse A", true);
        addLocation(TENANT, LOC_B, "Warehouse B", true);
        addLocation(TENANT, LOC_INACTIVE, "Closed Store", false);
        addLocation(OTHER_TENANT, OTHER_LOCATION, "Foreign Warehouse", true);
    }

    void addProduct(const std::string& tenantId, const std::string& id, const std::string& name,
                    domain::ProductType type, std::optional<domain::PricingMethod> method, bool deleted = false,
                    int64_t reorderLevel = 0) {
        domain::Product product;
        product.id = id;
        product.tenantId = tenantId;
        product.name = name;
        product.sku = "SKU-" + id;
        product.productType = type;
        product.pricingMethod = method;
        product.deleted = deleted;
        product.reorderLevel = reorderLevel;
        store_->addProduct(product);
    }

    void addLocation(const std::string& tenantId, const std::string& id, const std::string& name, bool active) {
        domain::Location location;
        location.id = id;
        location.tenantId = tenantId;
        location.name = name;
        location.code = "CODE-" + id;
        location.active = active;
        store_->addLocation(location);
    }

    domain::StockInResult receiveStock(const std::string& locationId, const std::string& productId,
                                       int64_t quantity, const std::string& unitCost) {
        domain::StockInRequest request;
        request.locationId = locationId;
        request.items.push_back({productId, quantity, domain::Money::fromString(unitCost), std::nullopt});
        return movements_->stockIn(TENANT, USER, request);
    }

    domain::Balance balanceOf(const std::string& productId, const std::string& locationId) {
        return balances_->getBalance(TENANT, productId, locationId);
    }

    std::vector<domain::ValuationLayer> layersOf(const std::string& productId, const std::string& locationId) {
        auto uow = factory_->begin();
        return uow->layers().findAll(TENANT, productId, locationId);
    }

    static bool waitUntil(const std::function<bool()>& condition,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (condition()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return condition();
    }

    std::shared_ptr<adapters::secondary::InMemoryStore> store_;
    std::shared_ptr<adapters::secondary::InMemoryUnitOfWorkFactory> factory_;
    std::shared_ptr<application::StockValidator> validator_;
    std::shared_ptr<application::ValuationEngine> valuation_;
    std::shared_ptr<application::BalanceTracker> balances_;
    std::shared_ptr<application::MovementService> movements_;
};

} // namespace inventory::tests
