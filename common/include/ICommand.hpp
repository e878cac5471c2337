#pragma once

#include <string>

/**
 * @file ICommand.hpp
 * @brief Интерфейс команды для фоновых очередей
 */

/**
 * @brief Единица работы, которую исполняет фоновый воркер
 *
 * Команда инкапсулирует операцию вместе с её параметрами, поэтому её можно
 * положить в очередь и исполнить в другом потоке.
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * @brief Выполнить команду
     * @throws std::exception при ошибке исполнения
     */
    virtual void execute() = 0;

    /**
     * @brief Имя команды для логов
     */
    virtual std::string name() const { return "command"; }
};
