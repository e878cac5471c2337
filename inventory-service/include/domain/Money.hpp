#pragma once

#include <boost/multiprecision/cpp_dec_float.hpp>

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace inventory::domain {

using Decimal = boost::multiprecision::cpp_dec_float_50;

/**
 * @brief Денежное значение с фиксированной точностью 4 знака
 *
 * Хранится в десятичном виде (Boost.Multiprecision), после каждого
 * умножения и деления квантуется до 0.0001 с округлением от нуля.
 * Совпадает с колонками NUMERIC(12,4) / NUMERIC(14,4) в PostgreSQL.
 */
class Money {
public:
    static constexpr int SCALE = 4;

    Money() = default;

    explicit Money(const Decimal& value) : value_(quantize(value)) {}

    static Money zero() { return Money(); }

    static Money fromUnits(int64_t units) {
        return Money(Decimal(units));
    }

    /**
     * @brief Разобрать строку вида "10.00" / "10,5"
     * @throws std::invalid_argument если строка не число
     */
    static Money fromString(const std::string& input) {
        std::string normalized;
        normalized.reserve(input.size());
        for (char c : input) {
            if (c == ' ') continue;
            normalized.push_back(c == ',' ? '.' : c);
        }
        if (normalized.empty()) {
            return Money();
        }
        try {
            return Money(Decimal(normalized));
        } catch (const std::exception&) {
            throw std::invalid_argument("Invalid money value: " + input);
        }
    }

    /**
     * @brief Средняя цена: total / quantity, 0 при quantity == 0
     */
    static Money divide(const Money& total, int64_t quantity) {
        if (quantity == 0) {
            return Money();
        }
        return Money(total.value_ / Decimal(quantity));
    }

    const Decimal& value() const { return value_; }

    std::string toString() const {
        std::ostringstream stream;
        stream << std::fixed << std::setprecision(SCALE) << value_;
        return stream.str();
    }

    bool isZero() const { return value_ == 0; }
    bool isNegative() const { return value_ < 0; }

    Money operator+(const Money& other) const { return Money(value_ + other.value_); }
    Money operator-(const Money& other) const { return Money(value_ - other.value_); }
    Money operator*(int64_t multiplier) const { return Money(value_ * Decimal(multiplier)); }

    Money& operator+=(const Money& other) {
        value_ = quantize(value_ + other.value_);
        return *this;
    }

    bool operator==(const Money& other) const { return value_ == other.value_; }
    bool operator!=(const Money& other) const { return value_ != other.value_; }
    bool operator<(const Money& other) const { return value_ < other.value_; }
    bool operator>(const Money& other) const { return value_ > other.value_; }
    bool operator<=(const Money& other) const { return value_ <= other.value_; }
    bool operator>=(const Money& other) const { return value_ >= other.value_; }

private:
    Decimal value_{0};

    static Decimal quantize(const Decimal& value) {
        static const Decimal factor(10000);
        Decimal scaled = value * factor;
        return Decimal(boost::multiprecision::round(scaled)) / factor;
    }
};

inline std::ostream& operator<<(std::ostream& os, const Money& money) {
    return os << money.toString();
}

} // namespace inventory::domain
