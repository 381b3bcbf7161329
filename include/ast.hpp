#pragma once

#include <memory>
#include <optional>

#include "operators.hpp"
#include "value.hpp"

namespace dice {

// Базовый класс для узла дерева выражения.
// Лист всегда хранит конкретное значение, внутренний узел всегда хранит оператор.
// Вычисленное значение запоминается в узле для подробного вывода.
class EvalTreeNode {
public:
    virtual ~EvalTreeNode() = default;

    // Рекурсивно вычисляет значение поддерева и запоминает его в узле
    virtual const Value& evaluate(RandomSource& random) = 0;

    // Глубокая копия поддерева вместе с запомненными значениями
    virtual std::unique_ptr<EvalTreeNode> clone() const = 0;

    virtual bool isLeaf() const = 0;
    virtual EvalTreeNode* left() const { return nullptr; }
    virtual EvalTreeNode* right() const { return nullptr; }

    // Оператор внутреннего узла, у листа nullptr
    virtual const Operator* op() const { return nullptr; }

    // Значение после последнего вычисления или nullptr
    const Value* value() const { return cached ? &*cached : nullptr; }

protected:
    std::optional<Value> cached;
};

// Лист: число или список граней
class ValueNode final : public EvalTreeNode {
public:
    explicit ValueNode(Value payload) : payload(std::move(payload)) {}

    const Value& evaluate(RandomSource& random) override;
    std::unique_ptr<EvalTreeNode> clone() const override;
    bool isLeaf() const override { return true; }

    const Value& content() const { return payload; }

private:
    Value payload;
};

// Внутренний узел: оператор и его операнды
class OperatorNode final : public EvalTreeNode {
public:
    // Набор потомков должен соответствовать арности оператора,
    // иначе выбрасывается std::invalid_argument
    OperatorNode(const Operator& op, std::unique_ptr<EvalTreeNode> left, std::unique_ptr<EvalTreeNode> right);

    const Value& evaluate(RandomSource& random) override;
    std::unique_ptr<EvalTreeNode> clone() const override;
    bool isLeaf() const override { return false; }
    EvalTreeNode* left() const override { return leftChild.get(); }
    EvalTreeNode* right() const override { return rightChild.get(); }
    const Operator* op() const override { return operation; }

    // Замена оператора на месте (d -> dc и т.п.), арность должна совпадать
    void setOperator(const Operator& op);

private:
    const Operator* operation;
    std::unique_ptr<EvalTreeNode> leftChild;  // Левый операнд
    std::unique_ptr<EvalTreeNode> rightChild; // Правый операнд
};

} // namespace dice
