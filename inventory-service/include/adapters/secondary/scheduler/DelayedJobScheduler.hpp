#pragma once

#include "ports/output/IJobScheduler.hpp"
#include "settings/SchedulerSettings.hpp"

#include <ThreadSafeMap.hpp>
#include <ThreadSafeQueue.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace inventory::adapters::secondary {

/// Обработчик задачи: получает payload, при ошибке бросает исключение
using JobHandler = std::function<void(const std::string& payload)>;

/**
 * @brief Задача, исчерпавшая попытки
 */
struct FailedJob {
    std::string key;
    std::string jobName;
    std::string payload;
    int attempts = 0;
    std::string lastError;
};

/**
 * @brief Внутрипроцессный планировщик отложенных задач
 *
 * Таймерный поток следит за ближайшим runAt и перекладывает созревшие
 * задачи в ThreadSafeQueue, пул воркеров их исполняет. Ключ задачи
 * уникален среди ожидающих. Ошибка обработчика ведёт к повтору
 * с экспоненциальной задержкой, после maxAttempts задача попадает
 * в failedJobs().
 *
 * Доставка at-least-once: задача, отменённая во время исполнения,
 * всё равно доисполняется.
 */
class DelayedJobScheduler : public ports::output::IJobScheduler {
public:
    explicit DelayedJobScheduler(const settings::SchedulerSettings& settings);
    ~DelayedJobScheduler() override;

    DelayedJobScheduler(const DelayedJobScheduler&) = delete;
    DelayedJobScheduler& operator=(const DelayedJobScheduler&) = delete;

    void registerHandler(const std::string& jobName, JobHandler handler);

    void start();

    /// Останавливает таймер и дожидается уже поставленных в очередь задач
    void stop();

    bool scheduleOnce(const std::string& key, const std::string& jobName,
                      const domain::Timestamp& runAt, const std::string& payload) override;

    bool cancel(const std::string& key) override;

    bool isPending(const std::string& key) const;
    size_t pendingCount() const;
    std::vector<FailedJob> failedJobs() const;

private:
    using Clock = std::chrono::system_clock;

    struct Job {
        std::string key;
        std::string jobName;
        std::string payload;
        Clock::time_point runAt;
        int attempt = 1;
    };

    class JobCommand;

    settings::SchedulerSettings settings_;
    ThreadSafeMap<std::string, JobHandler> handlers_;
    ThreadSafeQueue queue_;

    mutable std::mutex mutex_;
    std::condition_variable timerCv_;
    std::map<std::string, Job> pending_;
    std::multimap<Clock::time_point, std::string> timeline_;
    std::vector<FailedJob> failed_;

    std::atomic<bool> running_{false};
    std::thread timerThread_;
    std::vector<std::thread> workers_;

    void enqueueLocked(Job job);
    void eraseFromTimelineLocked(const Job& job);

    void timerLoop();
    void workerLoop(size_t index);
    void runJob(const Job& job);
    void onJobFailed(const Job& job, const std::string& error);
    std::chrono::milliseconds backoffFor(int attempt) const;
};

} // namespace inventory::adapters::secondary
