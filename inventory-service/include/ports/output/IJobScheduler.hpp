#pragma once

#include "domain/Timestamp.hpp"
#include <string>

namespace inventory::ports::output {

/**
 * @brief Планировщик отложенных задач
 *
 * Задача идентифицируется уникальным ключом. Доставка at-least-once,
 * обработчик обязан быть идемпотентным.
 */
class IJobScheduler {
public:
    virtual ~IJobScheduler() = default;

    /**
     * @brief Запланировать однократный запуск
     * @return false, если задача с таким ключом уже ждёт запуска
     */
    virtual bool scheduleOnce(const std::string& key, const std::string& jobName,
                              const domain::Timestamp& runAt, const std::string& payload) = 0;

    /**
     * @brief Отменить задачу
     * @return true, если задача была; отсутствие задачи - не ошибка
     */
    virtual bool cancel(const std::string& key) = 0;

    /// Перепланирование = cancel + scheduleOnce
    virtual void reschedule(const std::string& key, const std::string& jobName,
                            const domain::Timestamp& runAt, const std::string& payload) {
        cancel(key);
        scheduleOnce(key, jobName, runAt, payload);
    }
};

} // namespace inventory::ports::output
