/**
 * @file InMemoryUnitOfWorkTest.cpp
 * @brief Unit tests for the in-memory unit of work
 */

#include <gtest/gtest.h>
#include "adapters/secondary/persistence/InMemoryUnitOfWork.hpp"

#include <stdexcept>

using namespace inventory;
using namespace inventory::adapters::secondary;
using ports::output::LayerOrder;

class InMemoryUnitOfWorkTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryStore>();
        factory_ = std::make_shared<InMemoryUnitOfWorkFactory>(store_);
    }

    static domain::ValuationLayer layer(const std::string& id, const domain::Timestamp& createdAt, int64_t qty) {
        domain::ValuationLayer l;
        l.id = id;
        l.tenantId = "t1";
        l.productId = "p1";
        l.locationId = "l1";
        l.originalQty = qty;
        l.remainingQty = qty;
        l.unitCost = domain::Money::fromUnits(1);
        l.sourceMovementId = "m-" + id;
        l.createdAt = createdAt;
        return l;
    }

    std::shared_ptr<InMemoryStore> store_;
    std::shared_ptr<InMemoryUnitOfWorkFactory> factory_;
};

TEST_F(InMemoryUnitOfWorkTest, CommitPublishesChanges) {
    {
        auto uow = factory_->begin();
        uow->balances().incrementOnHand("t1", "p1", "l1", 5);
        uow->commit();
    }

    auto uow = factory_->begin();
    auto balance = uow->balances().find("t1", "p1", "l1");
    ASSERT_TRUE(balance.has_value());
    EXPECT_EQ(balance->onHandQuantity, 5);
}

TEST_F(InMemoryUnitOfWorkTest, DestroyWithoutCommitRollsBack) {
    {
        auto uow = factory_->begin();
        uow->balances().incrementOnHand("t1", "p1", "l1", 5);
        uow->transfers().nextSequence("t1", 2024);
    }

    auto uow = factory_->begin();
    EXPECT_FALSE(uow->balances().find("t1", "p1", "l1").has_value());
    EXPECT_EQ(uow->transfers().nextSequence("t1", 2024), 1);
}

TEST_F(InMemoryUnitOfWorkTest, DoubleCommitThrows) {
    auto uow = factory_->begin();
    uow->commit();
    EXPECT_THROW(uow->commit(), std::logic_error);
}

TEST_F(InMemoryUnitOfWorkTest, NextSequenceIsPerTenantAndYear) {
    auto uow = factory_->begin();
    EXPECT_EQ(uow->transfers().nextSequence("t1", 2024), 1);
    EXPECT_EQ(uow->transfers().nextSequence("t1", 2024), 2);
    EXPECT_EQ(uow->transfers().nextSequence("t1", 2025), 1);
    EXPECT_EQ(uow->transfers().nextSequence("t2", 2024), 1);
}

TEST_F(InMemoryUnitOfWorkTest, LayersWithEqualTimestampKeepInsertionOrder) {
    auto at = domain::Timestamp::fromEpochMillis(1700000000000);
    auto uow = factory_->begin();
    uow->layers().insert(layer("second-in-time", at.plus(std::chrono::milliseconds(1)), 1));
    uow->layers().insert(layer("a", at, 1));
    uow->layers().insert(layer("b", at, 1));

    auto oldest = uow->layers().findOpenForUpdate("t1", "p1", "l1", LayerOrder::OLDEST_FIRST);
    ASSERT_EQ(oldest.size(), 3u);
    EXPECT_EQ(oldest[0].id, "a");
    EXPECT_EQ(oldest[1].id, "b");
    EXPECT_EQ(oldest[2].id, "second-in-time");

    auto newest = uow->layers().findOpenForUpdate("t1", "p1", "l1", LayerOrder::NEWEST_FIRST);
    EXPECT_EQ(newest[0].id, "second-in-time");
    EXPECT_EQ(newest[1].id, "b");
    EXPECT_EQ(newest[2].id, "a");
}

TEST_F(InMemoryUnitOfWorkTest, ExhaustedLayersAreNotOpen) {
    auto uow = factory_->begin();
    uow->layers().insert(layer("a", domain::Timestamp::now(), 2));
    uow->layers().decrementRemaining("a", 2);

    EXPECT_TRUE(uow->layers().findOpenForUpdate("t1", "p1", "l1", LayerOrder::OLDEST_FIRST).empty());
    EXPECT_EQ(uow->layers().findAll("t1", "p1", "l1").size(), 1u);
    EXPECT_EQ(uow->layers().sumRemaining("t1", "p1", "l1"), 0);
    EXPECT_THROW(uow->layers().decrementRemaining("missing", 1), std::out_of_range);
}

TEST_F(InMemoryUnitOfWorkTest, CatalogIsTenantScoped) {
    domain::Product product;
    product.id = "p1";
    product.tenantId = "t1";
    product.name = "Widget";
    store_->addProduct(product);

    domain::Location location;
    location.id = "l1";
    location.tenantId = "t1";
    location.name = "Main";
    store_->addLocation(location);

    auto uow = factory_->begin();
    EXPECT_TRUE(uow->catalog().findProduct("t1", "p1").has_value());
    EXPECT_FALSE(uow->catalog().findProduct("t2", "p1").has_value());
    EXPECT_EQ(uow->catalog().findLocations("t1", {"l1", "l1"}).size(), 1u);
    EXPECT_TRUE(uow->catalog().findLocations("t2", {"l1"}).empty());
}
