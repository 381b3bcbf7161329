#include "number.hpp"

#include "errors.hpp"

#include <charconv>
#include <cmath>
#include <limits>

namespace dice {

namespace {
constexpr long long kMax = std::numeric_limits<long long>::max();
constexpr long long kMin = std::numeric_limits<long long>::min();

// Произведение по модулю больше этой границы не помещается в long long
constexpr double kProductLimit = 9.2e18;

bool bothIntegers(const Number& left, const Number& right) {
    return left.isInteger() && right.isInteger();
}

// Результат вещественной операции. NaN дальше не пропускаем:
// с ним ломается сортировка бросков и сравнения.
Number checkedReal(double value) {
    if (std::isnan(value)) {
        throw ArgumentValueError("Результат операции не является числом");
    }
    return Number(value);
}

bool addOverflows(long long a, long long b) {
    return b > 0 ? a > kMax - b : a < kMin - b;
}

bool subtractOverflows(long long a, long long b) {
    return b < 0 ? a > kMax + b : a < kMin + b;
}

bool multiplyOverflows(long long a, long long b) {
    return std::abs(static_cast<double>(a) * static_cast<double>(b)) > kProductLimit;
}
}

std::string Number::toString() const {
    if (integral) {
        return std::to_string(intValue);
    }
    if (std::isinf(realValue)) {
        return realValue > 0 ? "inf" : "-inf";
    }
    if (std::isnan(realValue)) {
        return "nan";
    }

    // Кратчайшая запись, однозначно восстанавливающая число.
    // Экспонента только для очень малых и очень больших: 0.0001, но 1e-05 и 1e+16
    double magnitude = std::abs(realValue);
    auto format = magnitude == 0.0 || (magnitude >= 1e-4 && magnitude < 1e16) ? std::chars_format::fixed
                                                                              : std::chars_format::scientific;
    char buffer[512];
    auto [end, error] = std::to_chars(buffer, buffer + sizeof(buffer), realValue, format);
    if (error != std::errc()) {
        return std::to_string(realValue);
    }
    std::string text(buffer, end);
    // Вещественное число всегда показываем с точкой: 3.0, а не 3
    if (text.find_first_of(".e") == std::string::npos) {
        text += ".0";
    }
    return text;
}

Number operator+(const Number& left, const Number& right) {
    if (bothIntegers(left, right) && !addOverflows(left.integer(), right.integer())) {
        return Number(left.integer() + right.integer());
    }
    return checkedReal(left.real() + right.real());
}

Number operator-(const Number& left, const Number& right) {
    if (bothIntegers(left, right) && !subtractOverflows(left.integer(), right.integer())) {
        return Number(left.integer() - right.integer());
    }
    return checkedReal(left.real() - right.real());
}

Number operator*(const Number& left, const Number& right) {
    if (bothIntegers(left, right) && !multiplyOverflows(left.integer(), right.integer())) {
        return Number(left.integer() * right.integer());
    }
    return checkedReal(left.real() * right.real());
}

Number operator/(const Number& left, const Number& right) {
    if (right.real() == 0.0) {
        throw ArgumentValueError("Деление на ноль");
    }
    return checkedReal(left.real() / right.real());
}

Number operator%(const Number& left, const Number& right) {
    if (right.real() == 0.0) {
        throw ArgumentValueError("Деление на ноль при взятии остатка");
    }

    if (bothIntegers(left, right)) {
        long long divisor = right.integer();
        if (divisor == -1) {
            return Number(0);
        }
        long long remainder = left.integer() % divisor;
        // Остаток принимает знак делителя: -7 % 3 == 2
        if (remainder != 0 && ((remainder < 0) != (divisor < 0))) {
            remainder += divisor;
        }
        return Number(remainder);
    }

    double remainder = std::fmod(left.real(), right.real());
    if (remainder != 0.0 && ((remainder < 0) != (right.real() < 0))) {
        remainder += right.real();
    }
    return checkedReal(remainder);
}

Number operator-(const Number& value) {
    if (value.isInteger() && value.integer() != kMin) {
        return Number(-value.integer());
    }
    return Number(-value.real());
}

Number power(const Number& base, const Number& exponent) {
    if (base.real() == 0.0 && exponent.real() < 0) {
        throw ArgumentValueError("Ноль нельзя возводить в отрицательную степень");
    }

    if (bothIntegers(base, exponent) && exponent.integer() >= 0) {
        // Быстрое возведение в степень, пока результат помещается в long long
        long long result = 1;
        long long factor = base.integer();
        long long remaining = exponent.integer();
        bool exact = true;
        while (remaining > 0 && exact) {
            if (remaining & 1) {
                if (multiplyOverflows(result, factor)) {
                    exact = false;
                    break;
                }
                result *= factor;
            }
            remaining >>= 1;
            if (remaining > 0) {
                if (multiplyOverflows(factor, factor)) {
                    exact = false;
                    break;
                }
                factor *= factor;
            }
        }
        if (exact) {
            return Number(result);
        }
    }

    return checkedReal(std::pow(base.real(), exponent.real()));
}

bool operator==(const Number& left, const Number& right) {
    if (bothIntegers(left, right)) {
        return left.integer() == right.integer();
    }
    return left.real() == right.real();
}

bool operator<(const Number& left, const Number& right) {
    if (bothIntegers(left, right)) {
        return left.integer() < right.integer();
    }
    return left.real() < right.real();
}

bool operator>(const Number& left, const Number& right) {
    return right < left;
}

bool operator<=(const Number& left, const Number& right) {
    return !(right < left);
}

bool operator>=(const Number& left, const Number& right) {
    return !(left < right);
}

std::ostream& operator<<(std::ostream& stream, const Number& value) {
    return stream << value.toString();
}

} // namespace dice
