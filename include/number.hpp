#pragma once

#include <ostream>
#include <string>

namespace dice {

// Число в выражении броска.
// Целые значения хранятся точно (64 бита), вещественные как double.
// Различие важно: деление всегда даёт вещественное число, а счётчики костей
// и аргумент факториала обязаны быть целыми.
class Number {
public:
    Number() = default;
    Number(int value) : integral(true), intValue(value), realValue(value) {}
    Number(long long value) : integral(true), intValue(value), realValue(static_cast<double>(value)) {}
    Number(double value) : integral(false), intValue(0), realValue(value) {}

    bool isInteger() const { return integral; }

    // Целое значение (у вещественного отбрасывается дробная часть)
    long long integer() const { return integral ? intValue : static_cast<long long>(realValue); }

    double real() const { return realValue; }

    // Истинность в логических операциях: всё, кроме нуля
    bool truthy() const { return realValue != 0.0; }

    // Текстовое представление: "12" для целых, "7.5" или "3.0" для вещественных
    std::string toString() const;

private:
    bool integral = true;
    long long intValue = 0;
    double realValue = 0.0;
};

Number operator+(const Number& left, const Number& right);
Number operator-(const Number& left, const Number& right);
Number operator*(const Number& left, const Number& right);

// Деление всегда вещественное. Выбрасывает ArgumentValueError при делении на ноль.
Number operator/(const Number& left, const Number& right);

// Остаток со знаком делителя. Выбрасывает ArgumentValueError при делении на ноль.
Number operator%(const Number& left, const Number& right);

Number operator-(const Number& value);

// Возведение в степень. Целое в неотрицательной целой степени остаётся целым.
Number power(const Number& base, const Number& exponent);

bool operator==(const Number& left, const Number& right);
bool operator<(const Number& left, const Number& right);
bool operator>(const Number& left, const Number& right);
bool operator<=(const Number& left, const Number& right);
bool operator>=(const Number& left, const Number& right);

std::ostream& operator<<(std::ostream& stream, const Number& value);

} // namespace dice
