// include/InventoryApp.hpp
#pragma once

#include <boost/di.hpp>

// Ports
#include "ports/input/IMovementService.hpp"
#include "ports/input/IReservationService.hpp"
#include "ports/input/ITransferService.hpp"
#include "ports/output/IJobScheduler.hpp"
#include "ports/output/IUnitOfWork.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/SchedulerSettings.hpp"

// Application
#include "application/BalanceTracker.hpp"
#include "application/MovementService.hpp"
#include "application/ReservationExpiryHandler.hpp"
#include "application/ReservationService.hpp"
#include "application/StockValidator.hpp"
#include "application/TransferService.hpp"
#include "application/ValuationEngine.hpp"

// Secondary Adapters
#include "adapters/secondary/persistence/InMemoryUnitOfWork.hpp"
#include "adapters/secondary/persistence/PostgresUnitOfWork.hpp"
#include "adapters/secondary/scheduler/DelayedJobScheduler.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

namespace di = boost::di;

namespace inventory {

/**
 * @brief Inventory Worker
 *
 * Поднимает складское ядро, запускает планировщик истечения резервов
 * и восстанавливает задачи для ACTIVE-резервов.
 * Без INVENTORY_DB_HOST работает на in-memory хранилище.
 *
 * run() = loadEnvironment() -> configureInjection() -> start()
 */
class InventoryApp {
public:
    InventoryApp() { std::cout << "[InventoryApp] Initializing..." << std::endl; }
    ~InventoryApp() { std::cout << "[InventoryApp] Shutting down..." << std::endl; }

    void run(int argc, char* argv[]) {
        loadEnvironment(argc, argv);
        configureInjection();
        start();
    }

    void stop() {
        running_ = false;
    }

    std::shared_ptr<ports::input::IMovementService> movementService() const { return movementService_; }
    std::shared_ptr<ports::input::ITransferService> transferService() const { return transferService_; }
    std::shared_ptr<ports::input::IReservationService> reservationService() const { return reservationService_; }

protected:
    void loadEnvironment(int argc, char* argv[]) {
        (void)argc;
        (void)argv;
        dbSettings_ = std::make_shared<settings::DbSettings>();
        schedulerSettings_ = std::make_shared<settings::SchedulerSettings>();
        std::cout << "[InventoryApp] Environment loaded" << std::endl;
    }

    void configureInjection() {
        std::cout << "[InventoryApp] Configuring DI..." << std::endl;

        // Шаг 1: Хранилище выбирается по окружению
        std::shared_ptr<ports::output::IUnitOfWorkFactory> uowFactory;
        if (dbSettings_->isConfigured()) {
            uowFactory = std::make_shared<adapters::secondary::PostgresUnitOfWorkFactory>(dbSettings_);
        } else {
            std::cout << "[InventoryApp] INVENTORY_DB_HOST is empty, using in-memory store" << std::endl;
            uowFactory = std::make_shared<adapters::secondary::InMemoryUnitOfWorkFactory>(
                std::make_shared<adapters::secondary::InMemoryStore>());
        }

        // Шаг 2: Планировщик - один экземпляр для сервиса и для запуска задач
        auto schedulerInjector = di::make_injector(
            di::bind<settings::SchedulerSettings>().to(schedulerSettings_)
        );
        scheduler_ = schedulerInjector.create<std::shared_ptr<adapters::secondary::DelayedJobScheduler>>();

        // Шаг 3: Основной injector с instance binding для хранилища и планировщика
        auto injector = di::make_injector(
            di::bind<ports::output::IUnitOfWorkFactory>().to(uowFactory),
            di::bind<ports::output::IJobScheduler>().to(scheduler_),

            di::bind<application::StockValidator>().in(di::singleton),
            di::bind<application::ValuationEngine>().in(di::singleton),
            di::bind<application::BalanceTracker>().in(di::singleton),
            di::bind<application::MovementService>().in(di::singleton),
            di::bind<application::TransferService>().in(di::singleton),
            di::bind<application::ReservationService>().in(di::singleton),
            di::bind<application::ReservationExpiryHandler>().in(di::singleton)
        );

        auto movements = injector.create<std::shared_ptr<application::MovementService>>();
        auto transfers = injector.create<std::shared_ptr<application::TransferService>>();
        auto reservations = injector.create<std::shared_ptr<application::ReservationService>>();
        auto expiryHandler = injector.create<std::shared_ptr<application::ReservationExpiryHandler>>();

        movementService_ = movements;
        transferService_ = transfers;
        reservationService_ = reservations;

        // Шаг 4: Обработчик регистрируется ДО старта воркеров
        scheduler_->registerHandler(application::ReservationExpiryHandler::JOB_NAME,
            [expiryHandler](const std::string& payload) {
                expiryHandler->handlePayload(payload);
            });

        std::cout << "[InventoryApp] Starting expiry scheduler..." << std::endl;
        scheduler_->start();
        reservations->recoverExpiryJobs();

        std::cout << "[InventoryApp] Ready" << std::endl;
    }

    void start() {
        running_ = true;
        while (running_) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        scheduler_->stop();
    }

private:
    std::atomic<bool> running_{false};

    std::shared_ptr<settings::DbSettings> dbSettings_;
    std::shared_ptr<settings::SchedulerSettings> schedulerSettings_;
    std::shared_ptr<adapters::secondary::DelayedJobScheduler> scheduler_;

    std::shared_ptr<ports::input::IMovementService> movementService_;
    std::shared_ptr<ports::input::ITransferService> transferService_;
    std::shared_ptr<ports::input::IReservationService> reservationService_;
};

} // namespace inventory
