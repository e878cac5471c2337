/**
 * @file StockValidatorTest.cpp
 * @brief Unit tests for StockValidator
 */

#include "../support/InventoryFixture.hpp"
#include "domain/exceptions/InventoryException.hpp"

#include <gmock/gmock.h>

using namespace inventory;
using namespace inventory::tests;
using ::testing::HasSubstr;

class StockValidatorTest : public InventoryFixture {
protected:
    std::string messageOf(const std::function<void()>& action) {
        try {
            action();
        } catch (const domain::InventoryException& e) {
            return e.what();
        }
        return "";
    }
};

TEST_F(StockValidatorTest, ValidateProducts_AcceptsStockableProducts) {
    auto uow = factory_->begin();
    EXPECT_NO_THROW(validator_->validateProducts(*uow, TENANT, {FIFO, LIFO, AVG, FIFO}));
}

TEST_F(StockValidatorTest, ValidateProducts_ListsMissingIds) {
    auto uow = factory_->begin();
    EXPECT_THROW(validator_->validateProducts(*uow, TENANT, {FIFO, "ghost-1"}), domain::NotFoundException);

    auto message = messageOf([&] { validator_->validateProducts(*uow, TENANT, {"ghost-1", FIFO, "ghost-2"}); });
    EXPECT_EQ(message, "Products not found: ghost-1, ghost-2");
}

TEST_F(StockValidatorTest, ValidateProducts_DeletedAndForeignAreNotFound) {
    auto uow = factory_->begin();
    EXPECT_THROW(validator_->validateProducts(*uow, TENANT, {GONE}), domain::NotFoundException);
    EXPECT_THROW(validator_->validateProducts(*uow, TENANT, {OTHER_PRODUCT}), domain::NotFoundException);
}

TEST_F(StockValidatorTest, ValidateProducts_RejectsParentProduct) {
    auto uow = factory_->begin();
    EXPECT_THROW(validator_->validateProducts(*uow, TENANT, {FIFO, PARENT}), domain::BadRequestException);

    auto message = messageOf([&] { validator_->validateProducts(*uow, TENANT, {PARENT}); });
    EXPECT_THAT(message, HasSubstr("Cannot perform stock operations on parent products: T-Shirt"));
}

TEST_F(StockValidatorTest, ValidateLocation_RejectsInactiveAndForeign) {
    auto uow = factory_->begin();
    EXPECT_EQ(validator_->validateLocation(*uow, TENANT, LOC_A).name, "Warehouse A");
    EXPECT_THROW(validator_->validateLocation(*uow, TENANT, LOC_INACTIVE), domain::NotFoundException);
    EXPECT_THROW(validator_->validateLocation(*uow, TENANT, OTHER_LOCATION), domain::NotFoundException);
}

TEST_F(StockValidatorTest, ValidateLocations_ReturnsAllOrThrows) {
    auto uow = factory_->begin();
    auto locations = validator_->validateLocations(*uow, TENANT, {LOC_A, LOC_B});
    EXPECT_EQ(locations.size(), 2u);

    EXPECT_THROW(validator_->validateLocations(*uow, TENANT, {LOC_A, LOC_INACTIVE}), domain::NotFoundException);
}

TEST_F(StockValidatorTest, Availability_ReportsFirstShortage) {
    receiveStock(LOC_A, FIFO, 10, "1.00");
    {
        auto uow = factory_->begin();
        balances_->updateReserved(*uow, FIFO, LOC_A, TENANT, 3);
        uow->commit();
    }

    auto uow = factory_->begin();
    EXPECT_NO_THROW(validator_->validateStockAvailability(*uow, TENANT, LOC_A, {{FIFO, 7}}));

    auto message = messageOf([&] {
        validator_->validateStockAvailability(*uow, TENANT, LOC_A, {{FIFO, 8}});
    });
    EXPECT_EQ(message, "Insufficient stock for \"Widget FIFO\". On-hand: 10, Reserved: 3, Available: 7, Requested: 8");
}

TEST_F(StockValidatorTest, Availability_AggregatesDuplicateLines) {
    receiveStock(LOC_A, FIFO, 10, "1.00");

    auto uow = factory_->begin();
    EXPECT_THROW(validator_->validateStockAvailability(*uow, TENANT, LOC_A, {{FIFO, 6}, {FIFO, 6}}),
                 domain::BadRequestException);
}

TEST_F(StockValidatorTest, Availability_MissingBalanceRowIsZero) {
    auto uow = factory_->begin();
    auto message = messageOf([&] {
        validator_->validateStockAvailability(*uow, TENANT, LOC_B, {{LIFO, 1}});
    });
    EXPECT_EQ(message, "Insufficient stock for \"Widget LIFO\". On-hand: 0, Reserved: 0, Available: 0, Requested: 1");
}
