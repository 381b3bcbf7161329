#include "token.hpp"

namespace dice {

Token makeNumberToken(Number value, std::size_t position) {
    Token token;
    token.type = TokenType::Number;
    token.number = value;
    token.position = position;
    return token;
}

Token makeFacesToken(Faces faces, std::size_t position) {
    Token token;
    token.type = TokenType::Faces;
    token.faces = std::move(faces);
    token.position = position;
    return token;
}

Token makeOperatorToken(const Operator& op, std::size_t position) {
    Token token;
    token.type = TokenType::Operator;
    token.op = &op;
    token.position = position;
    return token;
}

Token makeOperatorToken(std::string_view code, std::size_t position) {
    return makeOperatorToken(getOperator(code), position);
}

Token makeParenToken(bool open, std::size_t position) {
    Token token;
    token.type = open ? TokenType::LParen : TokenType::RParen;
    token.position = position;
    return token;
}

bool operator==(const Token& left, const Token& right) {
    if (left.type != right.type) {
        return false;
    }
    switch (left.type) {
    case TokenType::Number:
        return left.number == right.number;
    case TokenType::Faces:
        return left.faces == right.faces;
    case TokenType::Operator:
        return *left.op == *right.op;
    default:
        return true;
    }
}

std::string toString(const Token& token) {
    switch (token.type) {
    case TokenType::Number:
        return token.number.toString();
    case TokenType::Faces:
        return Die(token.faces).toString();
    case TokenType::Operator:
        return token.op->code;
    case TokenType::LParen:
        return "(";
    case TokenType::RParen:
        return ")";
    }
    return {};
}

std::ostream& operator<<(std::ostream& stream, const Token& token) {
    return stream << toString(token);
}

} // namespace dice
