#pragma once

#include <string>
#include <vector>

#include "token.hpp"

namespace dice {

// Класс лексического анализатора (лексера)
// Преобразует строку с выражением броска в последовательность токенов:
// целые числа, списки граней, операторы и скобки.
// Пробельные символы только разделяют токены.
class Tokenizer {
public:
    // Конструктор принимает исходную строку выражения
    explicit Tokenizer(std::string sourceText);

    // Основной метод запуска токенизации
    // Выбрасывает ParseError с позицией ошибочного символа
    std::vector<Token> tokenize();

private:
    const std::string source;  // Исходная строка
    std::size_t index = 0;     // Текущая позиция чтения
    std::vector<Token> tokens; // Уже выделенные токены

    std::string numberRun;        // Накопленные цифры числа
    std::size_t numberStart = 0;
    std::string operatorRun;      // Накопленные символы оператора
    std::size_t operatorStart = 0;

    bool isAtEnd() const;
    char peek() const;
    char advance();

    // Проверка баланса скобок до начала разбора
    void checkParentheses() const;

    // Выталкивают накопленное число или оператор в список токенов
    void flushNumber();
    void flushOperator();

    // Является ли + или - в текущей позиции знаком числа
    bool signExpected() const;

    // Стоит ли перед текущей позицией оператор броска (d, da, dc, dm)
    bool diceOperatorBefore() const;

    void readParenthesis();
    void readOperatorChar();
    void readSideList();
    void readFudge();

    [[noreturn]] void fail(const std::string& message, std::size_t offset) const;
};

// Разбор строки в токены одним вызовом
std::vector<Token> tokenize(const std::string& source);

} // namespace dice
