#pragma once

#include <stdexcept>
#include <string>

namespace inventory::domain {

/**
 * @brief Категория ошибки для трансляции в код ответа на границе API
 */
enum class ErrorKind {
    NOT_FOUND,
    BAD_REQUEST,
    CONFLICT,
    TRANSIENT
};

inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_FOUND: return "NOT_FOUND";
        case ErrorKind::BAD_REQUEST: return "BAD_REQUEST";
        case ErrorKind::CONFLICT: return "CONFLICT";
        case ErrorKind::TRANSIENT: return "TRANSIENT";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Базовое исключение складского ядра
 */
class InventoryException : public std::runtime_error {
public:
    InventoryException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/// Товар, склад, перемещение или резерв не найден в рамках тенанта
class NotFoundException : public InventoryException {
public:
    explicit NotFoundException(const std::string& message)
        : InventoryException(ErrorKind::NOT_FOUND, message) {}
};

/// Ошибка во входных данных: недостаток остатка, пустая причина недостачи и т.п.
class BadRequestException : public InventoryException {
public:
    explicit BadRequestException(const std::string& message)
        : InventoryException(ErrorKind::BAD_REQUEST, message) {}
};

/// Недопустимый переход состояния
class ConflictException : public InventoryException {
public:
    explicit ConflictException(const std::string& message)
        : InventoryException(ErrorKind::CONFLICT, message) {}
};

/// Недоступность БД или планировщика
class TransientException : public InventoryException {
public:
    explicit TransientException(const std::string& message)
        : InventoryException(ErrorKind::TRANSIENT, message) {}
};

} // namespace inventory::domain
