#pragma once

#include "domain/exceptions/InventoryException.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <string>

namespace inventory::adapters::secondary {

/**
 * @brief Выполнить обращение к БД, переводя ошибки pqxx в TransientException
 *
 * Обрыв соединения, сериализационный конфликт и deadlock вызывающая
 * сторона может повторить целиком; единица работы к этому моменту
 * уже откатывается.
 */
template <typename Fn>
auto withPgErrors(const char* operation, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const pqxx::broken_connection& e) {
        std::cerr << "[Postgres] " << operation << ": connection lost: " << e.what() << std::endl;
        throw domain::TransientException(std::string("Database unavailable: ") + e.what());
    } catch (const pqxx::transaction_rollback& e) {
        std::cerr << "[Postgres] " << operation << ": transaction rolled back: " << e.what() << std::endl;
        throw domain::TransientException(std::string("Transaction conflict: ") + e.what());
    } catch (const pqxx::sql_error& e) {
        std::cerr << "[Postgres] " << operation << ": " << e.what() << " [" << e.query() << "]" << std::endl;
        throw domain::TransientException(std::string("Database error: ") + e.what());
    }
}

} // namespace inventory::adapters::secondary
