#include "eval_tree.hpp"

#include "errors.hpp"
#include "parser.hpp"
#include "tokenizer.hpp"

#include <exception>
#include <stdexcept>

namespace dice {

namespace {
// Операторы с приоритетом не ниже этого (броски и их обработка)
// выводятся как готовое значение и никогда не разбираются на части
constexpr int kOpaquePrecedence = 6;

std::unique_ptr<EvalTreeNode> zeroLeaf() {
    return std::make_unique<ValueNode>(Value(Number(0)));
}

void checkBinary(const Operator& op) {
    if (op.arity != Side::Both) {
        throw std::invalid_argument("Деревья можно объединить только бинарным оператором, получен " + op.code);
    }
}

void preOrderRecursive(EvalTreeNode* current, const NodePredicate& abort, std::vector<EvalTreeNode*>& nodes) {
    nodes.push_back(current);
    if (abort && abort(*current)) {
        return;
    }
    if (current->left() != nullptr) {
        preOrderRecursive(current->left(), abort, nodes);
    }
    if (current->right() != nullptr) {
        preOrderRecursive(current->right(), abort, nodes);
    }
}

// Скобки нужны, только если потомок связывает слабее родителя
void inOrderRecursive(EvalTreeNode* current, const EvalTreeNode* parent, const NodePredicate& abort,
                      std::vector<InOrderItem>& items) {
    if (current->isLeaf() || (abort && abort(*current))) {
        items.push_back({InOrderItem::Kind::Node, current});
        return;
    }

    bool parenthesize = parent != nullptr && parent->op()->precedence > current->op()->precedence;
    if (parenthesize) {
        items.push_back({InOrderItem::Kind::OpenParen, nullptr});
    }
    if (current->left() != nullptr) {
        inOrderRecursive(current->left(), current, abort, items);
    }
    items.push_back({InOrderItem::Kind::Node, current});
    if (current->right() != nullptr) {
        inOrderRecursive(current->right(), current, abort, items);
    }
    if (parenthesize) {
        items.push_back({InOrderItem::Kind::CloseParen, nullptr});
    }
}

bool isOpaque(const EvalTreeNode& node) {
    return !node.isLeaf() && node.op()->precedence >= kOpaquePrecedence;
}

std::string nodeText(const EvalTreeNode& node) {
    if (node.isLeaf() || isOpaque(node)) {
        const Value* value = node.value();
        if (value == nullptr) {
            throw std::logic_error("Узел дерева ещё не вычислен");
        }
        return toString(*value);
    }
    return node.op()->text();
}

bool nodesEqual(const EvalTreeNode* left, const EvalTreeNode* right) {
    if (left == nullptr || right == nullptr) {
        return left == right;
    }
    if (left->isLeaf() != right->isLeaf()) {
        return false;
    }
    if (left->isLeaf()) {
        const auto* leftLeaf = dynamic_cast<const ValueNode*>(left);
        const auto* rightLeaf = dynamic_cast<const ValueNode*>(right);
        return leftLeaf != nullptr && rightLeaf != nullptr && leftLeaf->content() == rightLeaf->content();
    }
    return *left->op() == *right->op() && nodesEqual(left->left(), right->left()) &&
           nodesEqual(left->right(), right->right());
}
}

EvalTree::EvalTree(const std::string& source) {
    Parser parser(tokenize(source), source);
    rootNode = parser.parse();
}

EvalTree::EvalTree(std::vector<Token> tokens) {
    Parser parser(std::move(tokens));
    rootNode = parser.parse();
}

EvalTree::EvalTree(Number number) : rootNode(std::make_unique<ValueNode>(Value(number))) {}

EvalTree::EvalTree(std::unique_ptr<EvalTreeNode> root) : rootNode(std::move(root)) {}

EvalTree::EvalTree(const EvalTree& other) : rootNode(other.rootNode ? other.rootNode->clone() : nullptr) {}

EvalTree& EvalTree::operator=(const EvalTree& other) {
    if (this != &other) {
        rootNode = other.rootNode ? other.rootNode->clone() : nullptr;
    }
    return *this;
}

Number EvalTree::evaluate() {
    return evaluate(defaultRandomSource());
}

Number EvalTree::evaluate(RandomSource& random) {
    if (!rootNode) {
        return Number(0);
    }
    try {
        return collapse(rootNode->evaluate(random));
    } catch (const std::exception& error) {
        std::throw_with_nested(EvaluationError(std::string("Не удалось вычислить выражение: ") + error.what()));
    }
}

std::string EvalTree::verboseResult() {
    return verboseResult(defaultRandomSource());
}

std::string EvalTree::verboseResult(RandomSource& random) {
    if (!rootNode) {
        return "";
    }
    if (rootNode->value() == nullptr) {
        evaluate(random);
    }

    std::string text;
    for (const InOrderItem& item : inOrder(isOpaque)) {
        switch (item.kind) {
        case InOrderItem::Kind::OpenParen:
            text += "(";
            break;
        case InOrderItem::Kind::CloseParen:
            text += ")";
            break;
        case InOrderItem::Kind::Node:
            text += nodeText(*item.node);
            break;
        }
    }
    return text + " = " + collapse(*rootNode->value()).toString();
}

// Крит вытесняет среднее, максимум вытесняет всё
EvalTree& EvalTree::critify() {
    replaceOperators({"d", "da"}, "dc");
    return *this;
}

EvalTree& EvalTree::averageify() {
    replaceOperators({"d"}, "da");
    return *this;
}

EvalTree& EvalTree::maxify() {
    replaceOperators({"d", "da", "dc"}, "dm");
    return *this;
}

EvalTree EvalTree::copy() const {
    return EvalTree(*this);
}

bool EvalTree::isCritical() const {
    return containsNatural(20);
}

bool EvalTree::isFail() const {
    return containsNatural(1);
}

std::vector<EvalTreeNode*> EvalTree::preOrder(const NodePredicate& abort) const {
    std::vector<EvalTreeNode*> nodes;
    if (rootNode) {
        preOrderRecursive(rootNode.get(), abort, nodes);
    }
    return nodes;
}

std::vector<InOrderItem> EvalTree::inOrder(const NodePredicate& abort) const {
    std::vector<InOrderItem> items;
    if (rootNode) {
        inOrderRecursive(rootNode.get(), nullptr, abort, items);
    }
    return items;
}

EvalTree EvalTree::combine(const Operator& op, const EvalTree& left, const EvalTree& right) {
    checkBinary(op);
    auto leftRoot = left.rootNode ? left.rootNode->clone() : zeroLeaf();
    auto rightRoot = right.rootNode ? right.rootNode->clone() : zeroLeaf();
    return EvalTree(std::make_unique<OperatorNode>(op, std::move(leftRoot), std::move(rightRoot)));
}

EvalTree& EvalTree::absorb(const Operator& op, EvalTree&& other) {
    checkBinary(op);
    auto leftRoot = rootNode ? std::move(rootNode) : zeroLeaf();
    auto rightRoot = other.rootNode ? std::move(other.rootNode) : zeroLeaf();
    rootNode = std::make_unique<OperatorNode>(op, std::move(leftRoot), std::move(rightRoot));
    return *this;
}

EvalTree& EvalTree::operator+=(EvalTree&& other) {
    return absorb(getOperator("+"), std::move(other));
}

EvalTree& EvalTree::operator-=(EvalTree&& other) {
    return absorb(getOperator("-"), std::move(other));
}

void EvalTree::replaceOperators(std::initializer_list<const char*> from, const char* to) {
    const Operator& replacement = getOperator(to);
    for (EvalTreeNode* node : preOrder()) {
        auto* operatorNode = dynamic_cast<OperatorNode*>(node);
        if (operatorNode == nullptr) {
            continue;
        }
        for (const char* code : from) {
            if (operatorNode->op()->code == code) {
                operatorNode->setOperator(replacement);
                break;
            }
        }
    }
}

// Спуск останавливается на первом броске d20 в каждой ветви
bool EvalTree::containsNatural(long long face) const {
    const Die d20(20);
    auto isD20Roll = [&d20](const EvalTreeNode& node) {
        const Value* value = node.value();
        const Roll* roll = value != nullptr ? std::get_if<Roll>(value) : nullptr;
        return roll != nullptr && roll->die() == d20;
    };

    for (const EvalTreeNode* node : preOrder(isD20Roll)) {
        if (isD20Roll(*node) && std::get<Roll>(*node->value()).contains(Number(face))) {
            return true;
        }
    }
    return false;
}

EvalTree operator+(const EvalTree& left, const EvalTree& right) {
    return EvalTree::combine(getOperator("+"), left, right);
}

EvalTree operator-(const EvalTree& left, const EvalTree& right) {
    return EvalTree::combine(getOperator("-"), left, right);
}

bool operator==(const EvalTree& left, const EvalTree& right) {
    return nodesEqual(left.root(), right.root());
}

} // namespace dice
