#pragma once

#include <string>
#include <variant>

#include "roll.hpp"

namespace dice {

// Значение узла дерева: число, список граней кости или результат броска
using Value = std::variant<Number, Faces, Roll>;

// Текст значения для подробного вывода
std::string toString(const Value& value);

// Сворачивает бросок или список граней в сумму, число возвращает как есть
Number collapse(const Value& value);

} // namespace dice
