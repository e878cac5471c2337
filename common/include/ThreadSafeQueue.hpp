#pragma once

#include "ICommand.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>

/**
 * @file ThreadSafeQueue.hpp
 * @brief Потокобезопасная очередь команд для пула воркеров
 * @details
 * Блокирующий pop() и pop с таймаутом, чтобы воркер мог периодически
 * проверять флаг остановки. После shutdown() очередь перестаёт принимать
 * команды, но уже поставленные можно дочитать.
 */
class ThreadSafeQueue {
public:
    ThreadSafeQueue();
    ~ThreadSafeQueue();

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @brief Добавить команду в конец очереди
     * @return false, если очередь уже закрыта или command == nullptr
     */
    bool push(std::shared_ptr<ICommand> command);

    /**
     * @brief Извлечь команду (блокирующий вызов)
     * @return команда, либо nullptr, если очередь закрыта и пуста
     */
    std::shared_ptr<ICommand> pop();

    /**
     * @brief Извлечь команду, ожидая не дольше timeout
     * @return команда, либо nullptr по таймауту или после закрытия
     */
    std::shared_ptr<ICommand> popFor(std::chrono::milliseconds timeout);

    /// Закрыть очередь и разбудить все ожидающие потоки
    void shutdown();

    bool isShutdown() const;
    bool isEmpty() const;
    size_t size() const;

private:
    std::deque<std::shared_ptr<ICommand>> queue_;
    mutable std::mutex mutex_;
    std::condition_variable condVar_;
    bool shutdown_ = false;
};
