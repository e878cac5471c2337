/**
 * @file ReservationExpiryHandlerTest.cpp
 * @brief Tests for reservation expiry, direct and through DelayedJobScheduler
 */

#include "../mocks/MockJobScheduler.hpp"
#include "../support/InventoryFixture.hpp"
#include "adapters/secondary/scheduler/DelayedJobScheduler.hpp"
#include "application/ReservationExpiryHandler.hpp"
#include "application/ReservationService.hpp"
#include "domain/exceptions/InventoryException.hpp"

#include <nlohmann/json.hpp>

using namespace inventory;
using namespace inventory::tests;
using application::ExpiryOutcome;
using domain::ReservationStatus;
using domain::Timestamp;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class ReservationExpiryHandlerTest : public InventoryFixture {
protected:
    void SetUp() override {
        InventoryFixture::SetUp();
        handler_ = std::make_shared<application::ReservationExpiryHandler>(factory_, balances_);
    }

    std::shared_ptr<application::ReservationService> serviceWith(std::shared_ptr<ports::output::IJobScheduler> scheduler) {
        return std::make_shared<application::ReservationService>(factory_, validator_, balances_, std::move(scheduler));
    }

    domain::CreateReservationRequest request(int64_t quantity, std::chrono::milliseconds ttl) {
        domain::CreateReservationRequest req;
        req.productId = FIFO;
        req.locationId = LOC_A;
        req.quantity = quantity;
        req.expiresAt = Timestamp::now().plus(ttl);
        return req;
    }

    std::shared_ptr<application::ReservationExpiryHandler> handler_;
};

TEST_F(ReservationExpiryHandlerTest, JobKeyAndPayload) {
    domain::StockReservation reservation;
    reservation.id = "r-1";
    reservation.tenantId = TENANT;

    EXPECT_EQ(application::ReservationExpiryHandler::jobKey("r-1"), "expire-r-1");

    auto body = nlohmann::json::parse(application::ReservationExpiryHandler::payload(reservation));
    EXPECT_EQ(body["reservationId"], "r-1");
    EXPECT_EQ(body["tenantId"], TENANT);
}

// ============================================================================
// DIRECT HANDLING
// ============================================================================

TEST_F(ReservationExpiryHandlerTest, ExpiresDueReservationOnce) {
    receiveStock(LOC_A, FIFO, 10, "1");
    auto scheduler = std::make_shared<NiceMock<MockJobScheduler>>();
    auto reservation = serviceWith(scheduler)->create(TENANT, USER, request(4, std::chrono::milliseconds(30)));
    std::this_thread::sleep_for(std::chrono::milliseconds(60));

    EXPECT_EQ(handler_->handle(TENANT, reservation.id), ExpiryOutcome::EXPIRED);
    EXPECT_EQ(handler_->handle(TENANT, reservation.id), ExpiryOutcome::ALREADY_RESOLVED);

    auto balance = balanceOf(FIFO, LOC_A);
    EXPECT_EQ(balance.reservedQuantity, 0);
    EXPECT_EQ(balance.onHandQuantity, 10);

    auto uow = factory_->begin();
    EXPECT_EQ(uow->reservations().findById(TENANT, reservation.id)->status, ReservationStatus::EXPIRED);
}

TEST_F(ReservationExpiryHandlerTest, IgnoresNotYetDueReservation) {
    receiveStock(LOC_A, FIFO, 10, "1");
    auto scheduler = std::make_shared<NiceMock<MockJobScheduler>>();
    auto reservation = serviceWith(scheduler)->create(TENANT, USER, request(4, std::chrono::hours(1)));

    EXPECT_EQ(handler_->handle(TENANT, reservation.id), ExpiryOutcome::NOT_DUE);
    EXPECT_EQ(balanceOf(FIFO, LOC_A).reservedQuantity, 4);
}

TEST_F(ReservationExpiryHandlerTest, IgnoresReleasedAndMissing) {
    receiveStock(LOC_A, FIFO, 10, "1");
    auto scheduler = std::make_shared<NiceMock<MockJobScheduler>>();
    auto service = serviceWith(scheduler);
    auto reservation = service->create(TENANT, USER, request(4, std::chrono::milliseconds(30)));
    service->release(TENANT, reservation.id);
    std::this_thread::sleep_for(std::chrono::milliseconds(60));

    EXPECT_EQ(handler_->handle(TENANT, reservation.id), ExpiryOutcome::ALREADY_RESOLVED);
    EXPECT_EQ(handler_->handle(TENANT, "missing"), ExpiryOutcome::NOT_FOUND);
    EXPECT_EQ(handler_->handle(OTHER_TENANT, reservation.id), ExpiryOutcome::NOT_FOUND);
    EXPECT_EQ(balanceOf(FIFO, LOC_A).reservedQuantity, 0);
}

TEST_F(ReservationExpiryHandlerTest, RejectsMalformedPayload) {
    EXPECT_THROW(handler_->handlePayload("not json"), domain::BadRequestException);
    EXPECT_THROW(handler_->handlePayload("{\"tenantId\":\"tenant-1\"}"), domain::BadRequestException);
    EXPECT_EQ(handler_->handlePayload("{\"tenantId\":\"tenant-1\",\"reservationId\":\"nope\"}"),
              ExpiryOutcome::NOT_FOUND);
}

// ============================================================================
// END TO END
// ============================================================================

TEST_F(ReservationExpiryHandlerTest, ScheduledJobExpiresReservation) {
    receiveStock(LOC_A, FIFO, 10, "1");

    settings::SchedulerSettings settings(1, 3, std::chrono::milliseconds(50));
    auto scheduler = std::make_shared<adapters::secondary::DelayedJobScheduler>(settings);
    auto handler = handler_;
    scheduler->registerHandler(application::ReservationExpiryHandler::JOB_NAME,
                               [handler](const std::string& payload) { handler->handlePayload(payload); });
    scheduler->start();

    auto service = serviceWith(scheduler);
    auto reservation = service->create(TENANT, USER, request(7, std::chrono::milliseconds(1000)));
    EXPECT_EQ(balanceOf(FIFO, LOC_A).available(), 3);
    EXPECT_TRUE(scheduler->isPending(application::ReservationExpiryHandler::jobKey(reservation.id)));

    EXPECT_TRUE(waitUntil([&] {
        return service->findOne(TENANT, reservation.id).status == ReservationStatus::EXPIRED;
    }));
    EXPECT_EQ(balanceOf(FIFO, LOC_A).reservedQuantity, 0);
    EXPECT_TRUE(scheduler->failedJobs().empty());

    scheduler->stop();
}

TEST_F(ReservationExpiryHandlerTest, ReleasedReservationNeverExpires) {
    receiveStock(LOC_A, FIFO, 10, "1");

    settings::SchedulerSettings settings(1, 3, std::chrono::milliseconds(50));
    auto scheduler = std::make_shared<adapters::secondary::DelayedJobScheduler>(settings);
    scheduler->start();

    auto service = serviceWith(scheduler);
    auto reservation = service->create(TENANT, USER, request(7, std::chrono::milliseconds(300)));
    service->release(TENANT, reservation.id);

    EXPECT_FALSE(scheduler->isPending(application::ReservationExpiryHandler::jobKey(reservation.id)));
    EXPECT_EQ(scheduler->pendingCount(), 0u);
    EXPECT_EQ(service->findOne(TENANT, reservation.id).status, ReservationStatus::RELEASED);

    scheduler->stop();
}
