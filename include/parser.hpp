#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ast.hpp"
#include "token.hpp"

namespace dice {

// Класс синтаксического анализатора (парсера)
// Строит дерево выражения из списка токенов.
// Реализует алгоритм сортировочной станции: стек поддеревьев и стек операторов.
class Parser {
public:
    // Конструктор принимает список токенов от лексера.
    // Исходная строка нужна только для текста ошибок.
    explicit Parser(std::vector<Token> tokens, std::string source = {});

    // Основной метод запуска парсинга
    // Возвращает корень дерева; пустой список токенов даёт лист со значением 0
    // Выбрасывает ParseError при синтаксических ошибках
    std::unique_ptr<EvalTreeNode> parse();

    // Наибольшая глубина дерева. Вычисление, копирование и удаление дерева рекурсивны,
    // поэтому более глубокие выражения отвергаются ещё при разборе
    static constexpr std::size_t maxDepth = 1000;

private:
    // Поддерево на стеке вывода и позиция его первого токена
    struct Operand {
        std::unique_ptr<EvalTreeNode> node;
        std::size_t position = 0;
        std::size_t depth = 1;
    };

    const std::vector<Token> tokens; // Список токенов
    const std::string source;        // Исходная строка выражения

    std::vector<Operand> output;          // Частично построенные поддеревья
    std::vector<const Token*> operators;  // Операторы и открывающие скобки

    // Снимает оператор со стека и собирает узел из нужного числа поддеревьев
    void reduce();

    // Кладёт оператор на стек, предварительно свернув более сильные
    void pushOperator(const Token& token);

    // Обрабатывает закрывающую скобку
    void closeParenthesis(const Token& token);

    Operand popOperand();

    [[noreturn]] void fail(const std::string& message, std::size_t position) const;
};

} // namespace dice
