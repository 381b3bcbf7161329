#pragma once

#include <string>
#include <variant>
#include <vector>

#include "eval_tree.hpp"

namespace dice {

// Режим броска. Старший режим вытесняет младший: максимум сильнее крита, крит сильнее среднего.
enum class Mode {
    Normal,
    Average, // Каждая кость даёт среднее значение
    Crit,    // Критическое попадание: костей вдвое больше
    Max      // Каждая кость даёт максимум
};

// "average", "critical" или "maximum" без учёта регистра, иначе Normal
Mode modeFromString(const std::string& text);

// То, что можно бросить: строка выражения, число или готовое дерево
using Rollable = std::variant<std::string, Number, EvalTree>;

// Класс-фасад для бросков.
// Объединяет этапы токенизации, построения дерева, режимов и вычисления.
// Переданное готовое дерево копируется и не изменяется.
class Roller {
public:
    explicit Roller(RandomSource& random = defaultRandomSource()) : random(random) {}

    // Итоговое число. Пример: "3d4" при выпадении четвёрок -> 12
    Number basic(const Rollable& expression, Mode mode = Mode::Normal, const Number& modifiers = 0) const;

    // Выражение с подставленными бросками и итог: "1+[d20: 17] = 18"
    std::string verbose(const Rollable& expression, Mode mode = Mode::Normal, const Number& modifiers = 0) const;

    // Дерево для многократного использования. Принимает только строку или число.
    EvalTree compile(const Rollable& expression, const Number& modifiers = 0) const;

    // Токены выражения; модификатор добавляется как (выражение)+modifiers
    std::vector<Token> tokenize(const Rollable& expression, const Number& modifiers = 0) const;

private:
    RandomSource& random;
};

// Те же операции с общим источником случайных чисел
Number rollBasic(const Rollable& expression, Mode mode = Mode::Normal, const Number& modifiers = 0);
std::string rollVerbose(const Rollable& expression, Mode mode = Mode::Normal, const Number& modifiers = 0);
EvalTree compile(const Rollable& expression, const Number& modifiers = 0);

} // namespace dice
