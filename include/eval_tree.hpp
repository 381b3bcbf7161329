#pragma once

#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

#include "ast.hpp"
#include "token.hpp"

namespace dice {

// Элемент инфиксного обхода: узел дерева или скобка
struct InOrderItem {
    enum class Kind { Node, OpenParen, CloseParen };

    Kind kind = Kind::Node;
    EvalTreeNode* node = nullptr;
};

// Условие остановки спуска в обходах
using NodePredicate = std::function<bool(const EvalTreeNode&)>;

// Дерево выражения броска.
// Владеет корнем; пустое дерево означает выражение 0.
// Копирование глубокое: копии можно вычислять и изменять независимо.
class EvalTree {
public:
    EvalTree() = default;
    explicit EvalTree(const std::string& source);
    explicit EvalTree(std::vector<Token> tokens);
    explicit EvalTree(Number number);
    explicit EvalTree(std::unique_ptr<EvalTreeNode> root);

    EvalTree(const EvalTree& other);
    EvalTree& operator=(const EvalTree& other);
    EvalTree(EvalTree&&) noexcept = default;
    EvalTree& operator=(EvalTree&&) noexcept = default;

    // Вычисляет дерево заново (с новыми бросками) и запоминает значения в узлах.
    // Бросок в корне сворачивается в сумму. Пустое дерево даёт 0.
    // Любая ошибка оператора оборачивается в EvaluationError.
    Number evaluate();
    Number evaluate(RandomSource& random);

    // Выражение с подставленными бросками и итог: "1+[d20: 4] = 5".
    // Вычисляет дерево, только если оно ещё не вычислялось.
    std::string verboseResult();
    std::string verboseResult(RandomSource& random);

    // Замена операторов броска для режимов; возвращают само дерево
    EvalTree& critify();
    EvalTree& averageify();
    EvalTree& maxify();

    EvalTree copy() const;

    // Есть ли среди вычисленных бросков d20 натуральная 20 (или 1)
    bool isCritical() const;
    bool isFail() const;

    // Прямой обход; abort останавливает спуск ниже узла
    std::vector<EvalTreeNode*> preOrder(const NodePredicate& abort = {}) const;

    // Инфиксный обход с минимальной расстановкой скобок
    std::vector<InOrderItem> inOrder(const NodePredicate& abort = {}) const;

    // Объединение копий двух деревьев под новым корнем: (a) op (b)
    static EvalTree combine(const Operator& op, const EvalTree& left, const EvalTree& right);

    // Объединение с передачей владения: other становится пустым
    EvalTree& absorb(const Operator& op, EvalTree&& other);

    EvalTree& operator+=(EvalTree&& other);
    EvalTree& operator-=(EvalTree&& other);

    EvalTreeNode* root() const { return rootNode.get(); }
    bool empty() const { return rootNode == nullptr; }

private:
    std::unique_ptr<EvalTreeNode> rootNode;

    // Заменяет операторы из списка from на to во всём дереве
    void replaceOperators(std::initializer_list<const char*> from, const char* to);

    bool containsNatural(long long face) const;
};

EvalTree operator+(const EvalTree& left, const EvalTree& right);
EvalTree operator-(const EvalTree& left, const EvalTree& right);

// Деревья равны, если совпадают их формы и содержимое узлов
bool operator==(const EvalTree& left, const EvalTree& right);

} // namespace dice
