#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "random_source.hpp"
#include "value.hpp"

namespace dice {

// С какой стороны оператор берёт операнды. Значения образуют битовую маску.
enum class Side : unsigned {
    Neither = 0b00,
    Right = 0b01,
    Left = 0b10,
    Both = 0b11
};

constexpr bool includes(Side set, Side side) {
    return (static_cast<unsigned>(set) & static_cast<unsigned>(side)) != 0;
}

// Неизменяемое описание оператора выражения.
// Таблица операторов строится один раз и управляет как разбором
// (приоритет, ассоциативность, арность), так и вычислением.
struct Operator {
    // Операнды передаются в порядке слева направо, только те, что требует арность
    using Function = Value (*)(const std::vector<Value>& operands, RandomSource& random);

    std::string code;              // Ключ в таблице: "d", ">=", "!"
    int precedence = 0;            // Чем больше, тем сильнее связывает
    Function function = nullptr;
    Side arity = Side::Both;       // Какие операнды забирает оператор
    Side associativity = Side::Left;
    Side cajole = Side::Both;      // Какие операнды сворачиваются в сумму перед вызовом
    std::string display;           // Текст для вывода, если отличается от code

    // Текст оператора в подробном выводе
    const std::string& text() const { return display.empty() ? code : display; }

    bool takesLeft() const { return includes(arity, Side::Left); }
    bool takesRight() const { return includes(arity, Side::Right); }

    // Нужно ли свернуть этот оператор со стека до того, как положить incoming
    bool reducesBefore(const Operator& incoming) const;

    // Применяет оператор к значениям потомков узла.
    // Отсутствующий операнд передаётся как nullptr.
    Value apply(const Value* left, const Value* right, RandomSource& random) const;
};

// Операторы совпадают, если совпадают их коды
bool operator==(const Operator& left, const Operator& right);

using OperatorTable = std::map<std::string, Operator, std::less<>>;

// Полная таблица операторов
const OperatorTable& operatorTable();

// Оператор по коду или nullptr, если такого нет
const Operator* findOperator(std::string_view code);

// Оператор по коду. Выбрасывает std::out_of_range для неизвестного кода.
const Operator& getOperator(std::string_view code);

// Оператор, который можно набрать в выражении (знаки m и p внутренние)
const Operator* findLexeme(std::string_view code);

// Является ли text началом кода хотя бы одного набираемого оператора
bool isOperatorPrefix(std::string_view text);

// Может ли символ входить в код набираемого оператора
bool isOperatorChar(char ch);

// d, da, dc или dm
bool isDiceOperator(const Operator& op);

// Реализации операторов над бросками
namespace ops {

Roll thresholdLower(const Roll& roll, long long threshold);
Roll thresholdUpper(const Roll& roll, long long threshold);

Roll takeLow(const Roll& roll, long long count);
Roll takeHigh(const Roll& roll, long long count);

Number singleDie(const Die& die, RandomSource& random);

Roll rollBasic(long long count, const Die& die, RandomSource& random);
Roll rollCritical(long long count, const Die& die, RandomSource& random);
Roll rollMax(long long count, const Die& die);
Roll rollAverage(long long count, const Die& die);

// Условие переброса: значение и цель
using Comparison = bool (*)(const Number& value, const Number& target);

// Перебрасывает подходящие значения один раз
Roll rerollOnce(const Roll& original, const Number& target, Comparison shouldReroll, RandomSource& random);

// Перебрасывает подходящие значения, пока они не перестанут подходить
Roll rerollUnconditional(const Roll& original, const Number& target, Comparison shouldReroll,
                         RandomSource& random);

Roll rerollOnceOn(const Roll& original, const Number& target, RandomSource& random);
Roll rerollOnceHigher(const Roll& original, const Number& target, RandomSource& random);
Roll rerollOnceLower(const Roll& original, const Number& target, RandomSource& random);

// Бесконечные варианты отказываются работать, если условие остановки недостижимо
Roll rerollUnconditionalOn(const Roll& original, const Number& target, RandomSource& random);
Roll rerollUnconditionalHigher(const Roll& original, const Number& target, RandomSource& random);
Roll rerollUnconditionalLower(const Roll& original, const Number& target, RandomSource& random);

Roll floorValue(const Roll& original, const Number& bottom);
Roll ceilValue(const Roll& original, const Number& top);

Number factorial(long long number);

} // namespace ops

} // namespace dice
