#include "parser.hpp"

#include "errors.hpp"

#include <algorithm>

namespace dice {

Parser::Parser(std::vector<Token> tokens, std::string source)
    : tokens(std::move(tokens)), source(std::move(source)) {}

// Запуск процесса парсинга
// После всех токенов на стеке вывода должно остаться ровно одно дерево
std::unique_ptr<EvalTreeNode> Parser::parse() {
    output.clear();
    operators.clear();

    for (const Token& token : tokens) {
        switch (token.type) {
        case TokenType::Number:
            output.push_back({std::make_unique<ValueNode>(Value(token.number)), token.position, 1});
            break;
        case TokenType::Faces:
            output.push_back({std::make_unique<ValueNode>(Value(token.faces)), token.position, 1});
            break;
        case TokenType::LParen:
            operators.push_back(&token);
            break;
        case TokenType::RParen:
            closeParenthesis(token);
            break;
        case TokenType::Operator:
            pushOperator(token);
            break;
        }
    }

    while (!operators.empty()) {
        if (operators.back()->type == TokenType::LParen) {
            fail("Незакрытая скобка", operators.back()->position);
        }
        reduce();
    }

    if (output.empty()) {
        return std::make_unique<ValueNode>(Value(Number(0)));
    }
    if (output.size() > 1) {
        fail("Лишний операнд: не хватает оператора", output[1].position);
    }
    auto root = std::move(output.back().node);
    output.clear();
    return root;
}

void Parser::pushOperator(const Token& token) {
    // У префиксного оператора ещё нет левого операнда, поэтому он ничего не сворачивает:
    // иначе 2^-1 попыталось бы свернуть ^ без правого операнда
    if (token.op->takesLeft()) {
        while (!operators.empty() && operators.back()->type == TokenType::Operator &&
               operators.back()->op->reducesBefore(*token.op)) {
            reduce();
        }
    }
    operators.push_back(&token);
}

void Parser::closeParenthesis(const Token& token) {
    while (!operators.empty() && operators.back()->type != TokenType::LParen) {
        reduce();
    }
    if (operators.empty()) {
        fail("Закрывающая скобка без открывающей", token.position);
    }
    operators.pop_back();
}

void Parser::reduce() {
    const Token& token = *operators.back();
    operators.pop_back();
    const Operator& op = *token.op;

    std::size_t needed = (op.takesLeft() ? 1 : 0) + (op.takesRight() ? 1 : 0);
    if (output.size() < needed) {
        // Единственный доступный операнд стоит до оператора, значит не хватает правого
        bool rightMissing = op.takesRight() && (output.empty() || output.back().position < token.position);
        fail(std::string("Оператору ") + op.text() + " не хватает " + (rightMissing ? "правого" : "левого") +
                 " операнда",
             token.position);
    }

    Operand right;
    Operand left;
    if (op.takesRight()) {
        right = popOperand();
    }
    if (op.takesLeft()) {
        left = popOperand();
    }

    std::size_t depth = 1 + std::max(left.node ? left.depth : 0, right.node ? right.depth : 0);
    if (depth > maxDepth) {
        fail("Выражение вложено глубже " + std::to_string(maxDepth) + " уровней", token.position);
    }

    std::size_t position = op.takesLeft() ? left.position : token.position;
    output.push_back({std::make_unique<OperatorNode>(op, std::move(left.node), std::move(right.node)), position,
                      depth});
}

Parser::Operand Parser::popOperand() {
    Operand operand = std::move(output.back());
    output.pop_back();
    return operand;
}

void Parser::fail(const std::string& message, std::size_t position) const {
    throw ParseError(message, position, source);
}

} // namespace dice
