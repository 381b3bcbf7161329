#include "ast.hpp"

#include <stdexcept>

namespace dice {

// Лист уже содержит конкретное значение
const Value& ValueNode::evaluate(RandomSource&) {
    cached = payload;
    return *cached;
}

std::unique_ptr<EvalTreeNode> ValueNode::clone() const {
    auto copy = std::make_unique<ValueNode>(payload);
    copy->cached = cached;
    return copy;
}

OperatorNode::OperatorNode(const Operator& op, std::unique_ptr<EvalTreeNode> left,
                           std::unique_ptr<EvalTreeNode> right)
    : operation(&op), leftChild(std::move(left)), rightChild(std::move(right)) {
    if (op.takesLeft() != (leftChild != nullptr) || op.takesRight() != (rightChild != nullptr)) {
        throw std::invalid_argument("Операнды не соответствуют арности оператора " + op.code);
    }
}

// Сначала вычисляются операнды, затем к ним применяется оператор
const Value& OperatorNode::evaluate(RandomSource& random) {
    const Value* leftValue = leftChild ? &leftChild->evaluate(random) : nullptr;
    const Value* rightValue = rightChild ? &rightChild->evaluate(random) : nullptr;
    cached = operation->apply(leftValue, rightValue, random);
    return *cached;
}

std::unique_ptr<EvalTreeNode> OperatorNode::clone() const {
    auto copy = std::make_unique<OperatorNode>(*operation, leftChild ? leftChild->clone() : nullptr,
                                               rightChild ? rightChild->clone() : nullptr);
    copy->cached = cached;
    return copy;
}

void OperatorNode::setOperator(const Operator& op) {
    if (op.arity != operation->arity) {
        throw std::invalid_argument("Оператор " + op.code + " нельзя поставить на место " + operation->code);
    }
    operation = &op;
}

} // namespace dice
