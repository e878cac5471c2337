/**
 * @file MovementServiceTest.cpp
 * @brief Unit tests for MovementService
 */

#include "../support/InventoryFixture.hpp"
#include "application/LockOrder.hpp"
#include "domain/exceptions/InventoryException.hpp"

#include <gmock/gmock.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace inventory;
using namespace inventory::tests;
using domain::Money;
using ::testing::HasSubstr;

class MovementServiceTest : public InventoryFixture {
protected:
    domain::StockOutRequest outRequest(const std::string& locationId, const std::string& productId, int64_t quantity) {
        domain::StockOutRequest request;
        request.locationId = locationId;
        request.items.push_back({productId, quantity});
        return request;
    }
};

// ============================================================================
// STOCK IN
// ============================================================================

TEST_F(MovementServiceTest, StockIn_CreatesMovementLayerAndBalance) {
    auto result = receiveStock(LOC_A, FIFO, 100, "10");

    ASSERT_EQ(result.movementIds.size(), 1u);
    EXPECT_EQ(result.totalQuantity, 100);
    EXPECT_EQ(balanceOf(FIFO, LOC_A).onHandQuantity, 100);

    auto layers = layersOf(FIFO, LOC_A);
    ASSERT_EQ(layers.size(), 1u);
    EXPECT_EQ(layers[0].remainingQty, 100);
    EXPECT_EQ(layers[0].sourceMovementId, result.movementIds[0]);

    auto detail = movements_->findOne(TENANT, result.movementIds[0]);
    EXPECT_EQ(detail.movement.movementType, domain::MovementType::IN);
    EXPECT_EQ(detail.movement.referenceType, domain::ReferenceType::PURCHASE);
    EXPECT_EQ(detail.movement.totalCost.toString(), "1000.0000");
    EXPECT_EQ(detail.movement.createdById, USER);
    EXPECT_TRUE(detail.consumptions.empty());
}

TEST_F(MovementServiceTest, StockIn_MultipleItemsInOneCall) {
    domain::StockInRequest request;
    request.locationId = LOC_A;
    request.referenceType = domain::ReferenceType::RETURN;
    request.referenceId = "RMA-7";
    request.items.push_back({FIFO, 5, Money::fromString("2"), std::string("B-1")});
    request.items.push_back({LIFO, 3, Money::fromString("4"), std::nullopt});

    auto result = movements_->stockIn(TENANT, USER, request);

    EXPECT_EQ(result.movementIds.size(), 2u);
    EXPECT_EQ(result.totalQuantity, 8);
    auto detail = movements_->findOne(TENANT, result.movementIds[1]);
    EXPECT_EQ(detail.movement.referenceType, domain::ReferenceType::RETURN);
    EXPECT_EQ(detail.movement.referenceId, std::optional<std::string>("RMA-7"));
}

TEST_F(MovementServiceTest, StockIn_ProcessesByProductButKeepsRequestOrder) {
    domain::StockInRequest request;
    request.locationId = LOC_A;
    request.items.push_back({LIFO, 3, Money::fromString("4"), std::nullopt});
    request.items.push_back({FIFO, 5, Money::fromString("2"), std::nullopt});

    auto result = movements_->stockIn(TENANT, USER, request);

    ASSERT_EQ(result.movementIds.size(), 2u);
    EXPECT_EQ(movements_->findOne(TENANT, result.movementIds[0]).movement.productId, LIFO);
    EXPECT_EQ(movements_->findOne(TENANT, result.movementIds[1]).movement.productId, FIFO);
}

TEST_F(MovementServiceTest, IndicesByProduct_SortsStably) {
    std::vector<domain::AdjustItem> items = {{"p-b", 1, std::nullopt}, {"p-a", 2, std::nullopt},
                                             {"p-b", 3, std::nullopt}, {"p-a", 4, std::nullopt}};

    EXPECT_EQ(application::indicesByProduct(items), (std::vector<size_t>{1, 3, 0, 2}));
}

TEST_F(MovementServiceTest, StockIn_RejectsInvalidInput) {
    domain::StockInRequest empty;
    empty.locationId = LOC_A;
    EXPECT_THROW(movements_->stockIn(TENANT, USER, empty), domain::BadRequestException);

    EXPECT_THROW(receiveStock(LOC_A, FIFO, 0, "1"), domain::BadRequestException);
    EXPECT_THROW(receiveStock(LOC_A, FIFO, 1, "-1"), domain::BadRequestException);
    EXPECT_THROW(receiveStock(LOC_A, PARENT, 1, "1"), domain::BadRequestException);
    EXPECT_THROW(receiveStock(LOC_INACTIVE, FIFO, 1, "1"), domain::NotFoundException);
    EXPECT_THROW(receiveStock(LOC_A, "ghost", 1, "1"), domain::NotFoundException);
}

TEST_F(MovementServiceTest, StockIn_FailedItemRollsBackWholeRequest) {
    domain::StockInRequest request;
    request.locationId = LOC_A;
    request.items.push_back({FIFO, 5, Money::fromString("2"), std::nullopt});
    request.items.push_back({"ghost", 3, Money::fromString("4"), std::nullopt});

    EXPECT_THROW(movements_->stockIn(TENANT, USER, request), domain::NotFoundException);
    EXPECT_EQ(balanceOf(FIFO, LOC_A).onHandQuantity, 0);
    EXPECT_TRUE(layersOf(FIFO, LOC_A).empty());
}

// ============================================================================
// STOCK OUT
// ============================================================================

TEST_F(MovementServiceTest, StockOut_CostsFromLayers) {
    receiveStock(LOC_A, FIFO, 100, "10");

    auto result = movements_->stockOut(TENANT, USER, outRequest(LOC_A, FIFO, 60));

    EXPECT_EQ(result.totalQuantity, 60);
    EXPECT_EQ(result.totalCost.toString(), "600.0000");
    EXPECT_EQ(balanceOf(FIFO, LOC_A).onHandQuantity, 40);
    EXPECT_EQ(layersOf(FIFO, LOC_A)[0].remainingQty, 40);

    auto detail = movements_->findOne(TENANT, result.movementIds[0]);
    EXPECT_EQ(detail.movement.movementType, domain::MovementType::OUT);
    EXPECT_EQ(detail.movement.referenceType, domain::ReferenceType::SALE);
    EXPECT_EQ(detail.movement.unitCost.toString(), "10.0000");
    EXPECT_EQ(detail.movement.costingMethod, std::optional<domain::PricingMethod>(domain::PricingMethod::FIFO));
    ASSERT_EQ(detail.consumptions.size(), 1u);
    EXPECT_EQ(detail.consumptions[0].quantity, 60);
}

TEST_F(MovementServiceTest, StockOut_AcrossLayersRecordsEachConsumption) {
    receiveStock(LOC_A, FIFO, 5, "8");
    receiveStock(LOC_A, FIFO, 10, "10");

    auto result = movements_->stockOut(TENANT, USER, outRequest(LOC_A, FIFO, 8));

    EXPECT_EQ(result.totalCost.toString(), "70.0000");
    auto detail = movements_->findOne(TENANT, result.movementIds[0]);
    EXPECT_EQ(detail.consumptions.size(), 2u);
    EXPECT_EQ(detail.movement.unitCost.toString(), "8.7500");
}

TEST_F(MovementServiceTest, StockOut_DuplicateLinesShareLayers) {
    receiveStock(LOC_A, FIFO, 10, "3");

    domain::StockOutRequest request = outRequest(LOC_A, FIFO, 4);
    request.items.push_back({FIFO, 6});

    auto result = movements_->stockOut(TENANT, USER, request);

    EXPECT_EQ(result.movementIds.size(), 2u);
    EXPECT_EQ(result.totalCost.toString(), "30.0000");
    EXPECT_EQ(balanceOf(FIFO, LOC_A).onHandQuantity, 0);
}

TEST_F(MovementServiceTest, StockOut_InsufficientLeavesStateUnchanged) {
    receiveStock(LOC_A, FIFO, 10, "1");

    try {
        movements_->stockOut(TENANT, USER, outRequest(LOC_A, FIFO, 11));
        FAIL() << "Expected BadRequestException";
    } catch (const domain::BadRequestException& e) {
        EXPECT_THAT(e.what(), HasSubstr("Insufficient stock for \"Widget FIFO\""));
        EXPECT_THAT(e.what(), HasSubstr("Requested: 11"));
    }

    EXPECT_EQ(balanceOf(FIFO, LOC_A).onHandQuantity, 10);
    EXPECT_EQ(layersOf(FIFO, LOC_A)[0].remainingQty, 10);
}

TEST_F(MovementServiceTest, StockOut_RespectsReservations) {
    receiveStock(LOC_A, FIFO, 10, "1");
    {
        auto uow = factory_->begin();
        balances_->updateReserved(*uow, FIFO, LOC_A, TENANT, 6);
        uow->commit();
    }

    EXPECT_THROW(movements_->stockOut(TENANT, USER, outRequest(LOC_A, FIFO, 5)), domain::BadRequestException);
    EXPECT_NO_THROW(movements_->stockOut(TENANT, USER, outRequest(LOC_A, FIFO, 4)));
}

TEST_F(MovementServiceTest, StockOut_ConcurrentRequestsNeverOversell) {
    receiveStock(LOC_A, FIFO, 100, "1");

    std::atomic<int> succeeded{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 20; ++i) {
        threads.emplace_back([&]() {
            try {
                movements_->stockOut(TENANT, USER, outRequest(LOC_A, FIFO, 10));
                ++succeeded;
            } catch (const domain::BadRequestException&) {
                ++rejected;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(succeeded.load(), 10);
    EXPECT_EQ(rejected.load(), 10);
    EXPECT_EQ(balanceOf(FIFO, LOC_A).onHandQuantity, 0);
}

// ============================================================================
// ADJUST
// ============================================================================

TEST_F(MovementServiceTest, Adjust_AppliesBothDirections) {
    receiveStock(LOC_A, FIFO, 10, "2");

    domain::AdjustRequest request;
    request.locationId = LOC_A;
    request.reason = "Cycle count";
    request.note = "aisle 4";
    request.items.push_back({FIFO, -3, std::nullopt});
    request.items.push_back({LIFO, 7, Money::fromString("1.5")});

    auto result = movements_->adjust(TENANT, USER, request);

    EXPECT_EQ(result.positiveAdjustments, 1);
    EXPECT_EQ(result.negativeAdjustments, 1);
    EXPECT_EQ(balanceOf(FIFO, LOC_A).onHandQuantity, 7);
    EXPECT_EQ(balanceOf(LIFO, LOC_A).onHandQuantity, 7);

    auto out = movements_->findOne(TENANT, result.movementIds[0]);
    EXPECT_EQ(out.movement.referenceType, domain::ReferenceType::ADJUSTMENT);
    EXPECT_EQ(out.movement.note, std::optional<std::string>("Cycle count - aisle 4"));
    EXPECT_EQ(out.movement.totalCost.toString(), "6.0000");
}

TEST_F(MovementServiceTest, Adjust_PositiveWithoutCostUsesZero) {
    domain::AdjustRequest request;
    request.locationId = LOC_A;
    request.reason = "Found";
    request.items.push_back({FIFO, 2, std::nullopt});

    auto result = movements_->adjust(TENANT, USER, request);

    auto detail = movements_->findOne(TENANT, result.movementIds[0]);
    EXPECT_TRUE(detail.movement.unitCost.isZero());
    EXPECT_EQ(detail.movement.note, std::optional<std::string>("Found"));
}

TEST_F(MovementServiceTest, Adjust_RequiresReasonAndStock) {
    domain::AdjustRequest request;
    request.locationId = LOC_A;
    request.items.push_back({FIFO, -1, std::nullopt});

    EXPECT_THROW(movements_->adjust(TENANT, USER, request), domain::BadRequestException);

    request.reason = "Shrinkage";
    EXPECT_THROW(movements_->adjust(TENANT, USER, request), domain::BadRequestException);

    request.items[0].quantity = 0;
    EXPECT_THROW(movements_->adjust(TENANT, USER, request), domain::BadRequestException);
}

// ============================================================================
// FIND
// ============================================================================

TEST_F(MovementServiceTest, FindOne_ScopedByTenant) {
    auto result = receiveStock(LOC_A, FIFO, 1, "1");

    EXPECT_THROW(movements_->findOne(OTHER_TENANT, result.movementIds[0]), domain::NotFoundException);
    EXPECT_THROW(movements_->findOne(TENANT, "missing"), domain::NotFoundException);
}
