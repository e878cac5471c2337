// include/settings/SchedulerSettings.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <string>

namespace inventory::settings
{

    /**
     * @brief Настройки планировщика отложенных задач
     *
     * Задержка повтора растёт экспоненциально: backoff * 2^(attempt-1).
     */
    class SchedulerSettings
    {
    public:
        SchedulerSettings()
        {
            workers_ = static_cast<size_t>(std::stoul(getEnvOrDefault("INVENTORY_EXPIRY_WORKERS", "2")));
            maxAttempts_ = std::stoi(getEnvOrDefault("INVENTORY_EXPIRY_MAX_ATTEMPTS", "3"));
            backoff_ = std::chrono::milliseconds(std::stol(getEnvOrDefault("INVENTORY_EXPIRY_BACKOFF_MS", "5000")));
        }

        SchedulerSettings(size_t workers, int maxAttempts, std::chrono::milliseconds backoff)
            : workers_(workers), maxAttempts_(maxAttempts), backoff_(backoff)
        {
        }

        size_t getWorkers() const { return workers_ == 0 ? 1 : workers_; }
        int getMaxAttempts() const { return maxAttempts_ < 1 ? 1 : maxAttempts_; }
        std::chrono::milliseconds getBackoff() const { return backoff_; }

    private:
        size_t workers_;
        int maxAttempts_;
        std::chrono::milliseconds backoff_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace inventory::settings
