#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace dice {

// Базовый класс для всех ошибок библиотеки.
// Перехват RollError ловит любую ошибку разбора или вычисления броска.
class RollError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Ошибка разбора: выражение не удалось превратить в дерево.
// Хранит позицию символа и исходную строку, чтобы показать указатель ^ под ошибкой.
class ParseError : public RollError {
public:
    ParseError(std::string message, std::size_t offset, std::string source);

    const std::string& message() const { return text; }
    std::size_t offset() const { return position; }
    const std::string& source() const { return expression; }

private:
    std::string text;       // Описание ошибки без указателя
    std::size_t position;   // Позиция символа в исходной строке
    std::string expression; // Исходная строка
};

// В точку входа передан аргумент недопустимого вида
class InputTypeError : public RollError {
public:
    using RollError::RollError;
};

// Ошибка при вычислении дерева выражения
class EvaluationError : public RollError {
public:
    using RollError::RollError;
};

// Операнд оператора имеет неподходящий тип (например, число вместо броска)
class ArgumentTypeError : public EvaluationError {
public:
    using EvaluationError::EvaluationError;
};

// Операнд оператора имеет недопустимое значение (например, отрицательный факториал)
class ArgumentValueError : public EvaluationError {
public:
    using EvaluationError::EvaluationError;
};

} // namespace dice
