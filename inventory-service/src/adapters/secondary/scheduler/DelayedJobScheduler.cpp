#include "adapters/secondary/scheduler/DelayedJobScheduler.hpp"

#include <iostream>
#include <utility>

namespace inventory::adapters::secondary {

/**
 * @brief Созревшая задача в очереди воркеров
 */
class DelayedJobScheduler::JobCommand : public ICommand {
public:
    JobCommand(DelayedJobScheduler& scheduler, Job job)
        : scheduler_(scheduler), job_(std::move(job)) {}

    void execute() override {
        scheduler_.runJob(job_);
    }

    std::string name() const override {
        return job_.jobName + ":" + job_.key;
    }

private:
    DelayedJobScheduler& scheduler_;
    Job job_;
};

DelayedJobScheduler::DelayedJobScheduler(const settings::SchedulerSettings& settings)
    : settings_(settings)
{
    std::cout << "[DelayedJobScheduler] Created: workers=" << settings_.getWorkers()
              << ", maxAttempts=" << settings_.getMaxAttempts()
              << ", backoff=" << settings_.getBackoff().count() << "ms" << std::endl;
}

DelayedJobScheduler::~DelayedJobScheduler() {
    stop();
}

void DelayedJobScheduler::registerHandler(const std::string& jobName, JobHandler handler) {
    handlers_.insert(jobName, std::make_shared<JobHandler>(std::move(handler)));
    std::cout << "[DelayedJobScheduler] Registered handler: " << jobName << std::endl;
}

void DelayedJobScheduler::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }

    timerThread_ = std::thread(&DelayedJobScheduler::timerLoop, this);
    for (size_t i = 0; i < settings_.getWorkers(); ++i) {
        workers_.emplace_back(&DelayedJobScheduler::workerLoop, this, i);
    }
    std::cout << "[DelayedJobScheduler] Started" << std::endl;
}

void DelayedJobScheduler::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        timerCv_.notify_all();
    }
    if (timerThread_.joinable()) {
        timerThread_.join();
    }

    queue_.shutdown();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    std::cout << "[DelayedJobScheduler] Stopped, " << pendingCount() << " job(s) left pending" << std::endl;
}

bool DelayedJobScheduler::scheduleOnce(const std::string& key, const std::string& jobName,
                                       const domain::Timestamp& runAt, const std::string& payload)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.count(key)) {
        std::cout << "[DelayedJobScheduler] Job " << key << " already scheduled" << std::endl;
        return false;
    }

    enqueueLocked(Job{key, jobName, payload, runAt.value, 1});
    std::cout << "[DelayedJobScheduler] Scheduled " << jobName << " " << key
              << " at " << runAt.toString() << std::endl;
    return true;
}

bool DelayedJobScheduler::cancel(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(key);
    if (it == pending_.end()) {
        return false;
    }

    eraseFromTimelineLocked(it->second);
    pending_.erase(it);
    timerCv_.notify_all();

    std::cout << "[DelayedJobScheduler] Cancelled " << key << std::endl;
    return true;
}

bool DelayedJobScheduler::isPending(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(key) > 0;
}

size_t DelayedJobScheduler::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::vector<FailedJob> DelayedJobScheduler::failedJobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

void DelayedJobScheduler::enqueueLocked(Job job) {
    timeline_.emplace(job.runAt, job.key);
    auto key = job.key;
    pending_[key] = std::move(job);
    timerCv_.notify_all();
}

void DelayedJobScheduler::eraseFromTimelineLocked(const Job& job) {
    auto range = timeline_.equal_range(job.runAt);
    for (auto it = range.first; it != range.second; ++it) {
        if (it->second == job.key) {
            timeline_.erase(it);
            return;
        }
    }
}

void DelayedJobScheduler::timerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (running_) {
        if (timeline_.empty()) {
            timerCv_.wait(lock, [this] { return !running_ || !timeline_.empty(); });
            continue;
        }

        auto next = timeline_.begin()->first;
        if (Clock::now() < next) {
            // Будят новые задачи, отмена и остановка
            timerCv_.wait_until(lock, next);
            continue;
        }

        std::vector<Job> due;
        auto now = Clock::now();
        while (!timeline_.empty() && timeline_.begin()->first <= now) {
            auto key = timeline_.begin()->second;
            timeline_.erase(timeline_.begin());

            auto it = pending_.find(key);
            if (it != pending_.end()) {
                due.push_back(std::move(it->second));
                pending_.erase(it);
            }
        }

        lock.unlock();
        for (auto& job : due) {
            auto key = job.key;
            if (!queue_.push(std::make_shared<JobCommand>(*this, std::move(job)))) {
                std::cerr << "[DelayedJobScheduler] Queue closed, dropped " << key << std::endl;
            }
        }
        lock.lock();
    }
}

void DelayedJobScheduler::workerLoop(size_t index) {
    std::cout << "[DelayedJobScheduler] Worker " << index << " started" << std::endl;

    while (true) {
        auto command = queue_.popFor(std::chrono::milliseconds(100));
        if (!command) {
            if (queue_.isShutdown() && queue_.isEmpty()) {
                break;
            }
            continue;
        }

        try {
            command->execute();
        } catch (const std::exception& e) {
            std::cerr << "[DelayedJobScheduler] Worker " << index << " command "
                      << command->name() << " failed: " << e.what() << std::endl;
        }
    }

    std::cout << "[DelayedJobScheduler] Worker " << index << " stopped" << std::endl;
}

void DelayedJobScheduler::runJob(const Job& job) {
    auto handler = handlers_.find(job.jobName);
    if (!handler) {
        onJobFailed(job, "No handler registered for " + job.jobName);
        return;
    }

    try {
        (*handler)(job.payload);
        std::cout << "[DelayedJobScheduler] Completed " << job.key
                  << " (attempt " << job.attempt << ")" << std::endl;
    } catch (const std::exception& e) {
        onJobFailed(job, e.what());
    }
}

void DelayedJobScheduler::onJobFailed(const Job& job, const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (job.attempt >= settings_.getMaxAttempts()) {
        failed_.push_back({job.key, job.jobName, job.payload, job.attempt, error});
        std::cerr << "[DelayedJobScheduler] Giving up on " << job.key << " after "
                  << job.attempt << " attempt(s): " << error << std::endl;
        return;
    }

    if (pending_.count(job.key)) {
        // Пока задача исполнялась, её перепланировали: повтор не нужен
        std::cerr << "[DelayedJobScheduler] " << job.key << " failed (" << error
                  << "), newer schedule exists" << std::endl;
        return;
    }

    auto delay = backoffFor(job.attempt);
    Job retry = job;
    retry.attempt = job.attempt + 1;
    retry.runAt = Clock::now() + delay;
    enqueueLocked(std::move(retry));

    std::cerr << "[DelayedJobScheduler] " << job.key << " failed (attempt " << job.attempt
              << "): " << error << ", retry in " << delay.count() << "ms" << std::endl;
}

std::chrono::milliseconds DelayedJobScheduler::backoffFor(int attempt) const {
    auto multiplier = 1LL << (attempt - 1);
    return std::chrono::milliseconds(settings_.getBackoff().count() * multiplier);
}

} // namespace inventory::adapters::secondary
