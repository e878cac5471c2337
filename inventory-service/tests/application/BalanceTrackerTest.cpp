/**
 * @file BalanceTrackerTest.cpp
 * @brief Unit tests for BalanceTracker
 */

#include "../support/InventoryFixture.hpp"
#include "domain/exceptions/InventoryException.hpp"

using namespace inventory;
using namespace inventory::tests;

class BalanceTrackerTest : public InventoryFixture {};

TEST_F(BalanceTrackerTest, MissingRowReadsAsZero) {
    auto balance = balanceOf(FIFO, LOC_A);
    EXPECT_EQ(balance.onHandQuantity, 0);
    EXPECT_EQ(balance.reservedQuantity, 0);
    EXPECT_EQ(balance.productId, FIFO);
}

TEST_F(BalanceTrackerTest, UpdateBalance_CreatesThenIncrements) {
    {
        auto uow = factory_->begin();
        balances_->updateBalance(*uow, FIFO, LOC_A, TENANT, 10);
        balances_->updateBalance(*uow, FIFO, LOC_A, TENANT, -3);
        uow->commit();
    }
    EXPECT_EQ(balanceOf(FIFO, LOC_A).onHandQuantity, 7);
}

TEST_F(BalanceTrackerTest, UpdateBalance_NegativeDeltaOnMissingRowClampsToZero) {
    {
        auto uow = factory_->begin();
        balances_->updateBalance(*uow, FIFO, LOC_A, TENANT, -5);
        uow->commit();
    }
    EXPECT_EQ(balanceOf(FIFO, LOC_A).onHandQuantity, 0);
}

TEST_F(BalanceTrackerTest, UpdateReserved_TracksSeparately) {
    receiveStock(LOC_A, FIFO, 20, "1.00");
    {
        auto uow = factory_->begin();
        balances_->updateReserved(*uow, FIFO, LOC_A, TENANT, 8);
        uow->commit();
    }

    auto balance = balanceOf(FIFO, LOC_A);
    EXPECT_EQ(balance.onHandQuantity, 20);
    EXPECT_EQ(balance.reservedQuantity, 8);
    EXPECT_EQ(balance.available(), 12);
}

TEST_F(BalanceTrackerTest, UncommittedUpdateIsDiscarded) {
    {
        auto uow = factory_->begin();
        balances_->updateBalance(*uow, FIFO, LOC_A, TENANT, 10);
    }
    EXPECT_EQ(balanceOf(FIFO, LOC_A).onHandQuantity, 0);
}

// ============================================================================
// SUMMARIES
// ============================================================================

TEST_F(BalanceTrackerTest, ProductSummary_AggregatesLocations) {
    receiveStock(LOC_A, FIFO, 10, "1.00");
    receiveStock(LOC_B, FIFO, 5, "1.00");
    {
        auto uow = factory_->begin();
        balances_->updateReserved(*uow, FIFO, LOC_B, TENANT, 2);
        uow->commit();
    }

    auto summary = balances_->getProductSummary(TENANT, FIFO);

    EXPECT_EQ(summary.productName, "Widget FIFO");
    EXPECT_EQ(summary.productSku, "SKU-p-fifo");
    EXPECT_EQ(summary.totalOnHand, 15);
    EXPECT_EQ(summary.totalReserved, 2);
    EXPECT_EQ(summary.totalAvailable, 13);
    ASSERT_EQ(summary.locations.size(), 2u);
}

TEST_F(BalanceTrackerTest, ProductSummary_UnknownProductIsNotFound) {
    EXPECT_THROW(balances_->getProductSummary(TENANT, "nope"), domain::NotFoundException);
    EXPECT_THROW(balances_->getProductSummary(TENANT, OTHER_PRODUCT), domain::NotFoundException);
}

TEST_F(BalanceTrackerTest, LocationSummary_ListsProducts) {
    receiveStock(LOC_A, FIFO, 10, "1.00");
    receiveStock(LOC_A, LIFO, 4, "1.00");

    auto summary = balances_->getLocationSummary(TENANT, LOC_A);

    EXPECT_EQ(summary.locationName, "Warehouse A");
    EXPECT_EQ(summary.locationCode, "CODE-loc-a");
    EXPECT_EQ(summary.totalUnits, 14);
    EXPECT_EQ(summary.productCount, 2u);
}

TEST_F(BalanceTrackerTest, LocationSummary_UnknownLocationIsNotFound) {
    EXPECT_THROW(balances_->getLocationSummary(TENANT, OTHER_LOCATION), domain::NotFoundException);
}

// ============================================================================
// LOW STOCK
// ============================================================================

TEST_F(BalanceTrackerTest, GetLowStock_OrdersByShortageAndSkipsUnsetOrDeleted) {
    addProduct(TENANT, FIFO, "Widget FIFO", domain::ProductType::SIMPLE, std::nullopt, false, 10);
    addProduct(TENANT, LIFO, "Widget LIFO", domain::ProductType::SIMPLE, domain::PricingMethod::LIFO, false, 20);
    addProduct(TENANT, GONE, "Discontinued", domain::ProductType::SIMPLE, std::nullopt, true, 50);

    receiveStock(LOC_A, FIFO, 4, "1.00");    // нехватка 6
    receiveStock(LOC_B, FIFO, 2, "1.00");    // нехватка 8
    receiveStock(LOC_A, LIFO, 5, "1.00");    // нехватка 15
    receiveStock(LOC_B, LIFO, 20, "1.00");   // ровно на уровне
    receiveStock(LOC_A, AVG, 1, "1.00");     // уровень не задан
    {
        auto uow = factory_->begin();
        balances_->updateBalance(*uow, GONE, LOC_A, TENANT, 1);
        uow->commit();
    }

    auto lines = balances_->getLowStock(TENANT);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].productId, LIFO);
    EXPECT_EQ(lines[0].locationId, LOC_A);
    EXPECT_EQ(lines[0].shortage, 15);
    EXPECT_EQ(lines[1].productId, FIFO);
    EXPECT_EQ(lines[1].locationId, LOC_B);
    EXPECT_EQ(lines[1].shortage, 8);
    EXPECT_EQ(lines[2].productId, FIFO);
    EXPECT_EQ(lines[2].locationId, LOC_A);
    EXPECT_EQ(lines[2].shortage, 6);

    EXPECT_EQ(lines[0].productName, "Widget LIFO");
    EXPECT_EQ(lines[0].productSku, std::string("SKU-") + LIFO);
    EXPECT_EQ(lines[0].locationName, "Warehouse A");
    EXPECT_EQ(lines[0].onHandQuantity, 5);
    EXPECT_EQ(lines[0].reorderLevel, 20);
}

TEST_F(BalanceTrackerTest, GetLowStock_FiltersByLocationAndTenant) {
    addProduct(TENANT, FIFO, "Widget FIFO", domain::ProductType::SIMPLE, std::nullopt, false, 10);
    receiveStock(LOC_A, FIFO, 4, "1.00");
    receiveStock(LOC_B, FIFO, 2, "1.00");

    auto lines = balances_->getLowStock(TENANT, LOC_B);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].locationId, LOC_B);
    EXPECT_EQ(lines[0].shortage, 8);

    EXPECT_TRUE(balances_->getLowStock(OTHER_TENANT).empty());
}
