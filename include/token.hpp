#pragma once

#include <cstddef>
#include <ostream>
#include <string>

#include "operators.hpp"

namespace dice {

// Вид токена
enum class TokenType {
    Number,    // Целое число
    Faces,     // Список граней кости: [1,3,5] или F
    Operator,  // Оператор из таблицы
    LParen,    // (
    RParen     // )
};

// Токен, полученный лексером
struct Token {
    TokenType type = TokenType::Number;
    Number number;                // Значение для TokenType::Number
    Faces faces;                  // Значения для TokenType::Faces
    const Operator* op = nullptr; // Оператор для TokenType::Operator
    std::size_t position = 0;     // Позиция в исходной строке
};

Token makeNumberToken(Number value, std::size_t position = 0);
Token makeFacesToken(Faces faces, std::size_t position = 0);
Token makeOperatorToken(const Operator& op, std::size_t position = 0);
Token makeOperatorToken(std::string_view code, std::size_t position = 0);
Token makeParenToken(bool open, std::size_t position = 0);

// Токены равны, если совпадают вид и содержимое (позиция не учитывается)
bool operator==(const Token& left, const Token& right);

std::string toString(const Token& token);

std::ostream& operator<<(std::ostream& stream, const Token& token);

} // namespace dice
