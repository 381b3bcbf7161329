#include "test_common.hpp"
#include "test_helpers.hpp"

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

#include "errors.hpp"
#include "eval_tree.hpp"
#include "parser.hpp"
#include "tokenizer.hpp"

using namespace dice;

namespace {
std::unique_ptr<EvalTreeNode> leaf(long long value) {
    return std::make_unique<ValueNode>(Value(Number(value)));
}

std::unique_ptr<EvalTreeNode> node(const char* code, std::unique_ptr<EvalTreeNode> left,
                                   std::unique_ptr<EvalTreeNode> right) {
    return std::make_unique<OperatorNode>(getOperator(code), std::move(left), std::move(right));
}

// 1d(4d20)
EvalTree nestedRoll() {
    return EvalTree(node("d", leaf(1), node("d", leaf(4), leaf(20))));
}

bool nothingEvaluated(const EvalTree& tree) {
    for (const EvalTreeNode* current : tree.preOrder()) {
        if (current->value() != nullptr) {
            return false;
        }
    }
    return true;
}

ParseError parseErrorOf(const std::string& source) {
    try {
        EvalTree tree(source);
    }
    catch (const ParseError& error) {
        return error;
    }
    throw assertion_error("no ParseError for \"" + source + "\"");
}
}

void test_tree_nodes() {
    ScriptedRandom random;
    ValueNode four(Value(Number(4)));
    ASSERT(four.isLeaf());
    ASSERT(four.left() == nullptr);
    ASSERT(four.right() == nullptr);
    ASSERT(four.op() == nullptr);
    ASSERT(four.value() == nullptr);
    four.evaluate(random);
    ASSERT(four.value() != nullptr);
    ASSERT(*four.value() == four.content());

    ASSERT_THROWS(OperatorNode(getOperator("+"), leaf(1), nullptr), std::invalid_argument);
    ASSERT_THROWS(OperatorNode(getOperator("!"), nullptr, leaf(1)), std::invalid_argument);

    OperatorNode roll(getOperator("d"), leaf(1), leaf(6));
    roll.setOperator(getOperator("dm"));
    ASSERT_EQ(roll.op()->code, "dm");
    ASSERT_THROWS(roll.setOperator(getOperator("!")), std::invalid_argument);
}

void test_tree_prefab() {
    EvalTree fromTokens(std::vector<Token>{makeNumberToken(Number(4)), makeOperatorToken("d"),
                                           makeNumberToken(Number(6))});
    EvalTree expected(node("d", leaf(4), leaf(6)));
    ASSERT(fromTokens == expected);

    EvalTree fromExisting(fromTokens);
    ASSERT(fromExisting == fromTokens);

    ScriptedRandom random;
    ASSERT_EQ(EvalTree().evaluate(random), Number(0));
    ASSERT_EQ(EvalTree(Number(5)).evaluate(random), Number(5));
    ASSERT(EvalTree(std::vector<Token>()) == EvalTree(Number(0)));
}

void test_tree_simple_parse() {
    ASSERT(EvalTree("4d6") == EvalTree(node("d", leaf(4), leaf(6))));
    ASSERT(EvalTree("((3))") == EvalTree(leaf(3)));
}

void test_tree_precedence() {
    EvalTree expected(node("+", node("d", leaf(2), leaf(6)), node("*", leaf(5), node("^", leaf(2), leaf(2)))));
    ASSERT(EvalTree("2d6 + 5*2^2") == expected);

    EvalTree keep(node("+", node("h", node("d", leaf(4), leaf(6)), leaf(3)), leaf(2)));
    ASSERT(EvalTree("4d6h3+2") == keep);

    EvalTree negated(node("*", leaf(2), node("m", nullptr, node("d", leaf(1), leaf(4)))));
    ASSERT(EvalTree("2*-1d4") == negated);

    EvalTree factorial(node("-", node("!", leaf(4), nullptr), leaf(4)));
    ASSERT(EvalTree("4!-4") == factorial);
}

void test_tree_associativity() {
    ASSERT(EvalTree("3+4-5") == EvalTree(node("-", node("+", leaf(3), leaf(4)), leaf(5))));
    ASSERT(EvalTree("3 ^ 2 ^ 4") == EvalTree(node("^", leaf(3), node("^", leaf(2), leaf(4)))));
}

void test_tree_prefix_after_operator() {
    EvalTree inverse("2^-1");
    ASSERT(inverse == EvalTree(node("^", leaf(2), node("m", nullptr, leaf(1)))));

    ScriptedRandom random;
    ASSERT_EQ(inverse.evaluate(random), Number(0.5));
    ASSERT_EQ(EvalTree("-2^2").evaluate(random), Number(-4));
    ASSERT_EQ(EvalTree("--3").evaluate(random), Number(3));
}

void test_tree_parentheses() {
    ASSERT(EvalTree("3+(8-5)") == EvalTree(node("+", leaf(3), node("-", leaf(8), leaf(5)))));
    ASSERT(EvalTree("2*((8)+(4))") == EvalTree(node("*", leaf(2), node("+", leaf(8), leaf(4)))));
}

void test_tree_parse_errors() {
    ASSERT_THROWS(EvalTree("1 > = 4"), ParseError);
    ASSERT_THROWS(EvalTree("4d6rhl6"), ParseError);
    ASSERT_THROWS(EvalTree("1+"), ParseError);
    ASSERT_THROWS(EvalTree("d6"), ParseError);

    try {
        EvalTree tree("2 3");
        throw assertion_error("\"2 3\" parsed into a tree");
    }
    catch (const ParseError& error) {
        ASSERT_EQ(error.offset(), 2u);
    }

    // Баланс скобок проверяет лексер, но парсер не доверяет входу
    Parser parser({makeParenToken(true), makeNumberToken(Number(1)), makeOperatorToken("+"),
                   makeNumberToken(Number(2))});
    ASSERT_THROWS(parser.parse(), ParseError);
}

void test_tree_missing_operand_side() {
    ParseError trailing = parseErrorOf("1d20+");
    ASSERT_EQ(trailing.offset(), 4u);
    ASSERT(trailing.message().find("правого") != std::string::npos);

    // Парсер, получивший список без лексера, находит пропуск слева
    try {
        Parser parser({makeOperatorToken("*", 0), makeNumberToken(Number(2), 1)});
        parser.parse();
        throw assertion_error("\"*2\" parsed into a tree");
    }
    catch (const ParseError& error) {
        ASSERT(error.message().find("левого") != std::string::npos);
    }
}

void test_tree_depth_limit() {
    ScriptedRandom random;
    ASSERT_EQ(EvalTree(std::string(Parser::maxDepth - 1, '-') + "1").evaluate(random), Number(-1));

    ParseError deep = parseErrorOf(std::string(Parser::maxDepth, '-') + "1");
    ASSERT_EQ(deep.offset(), 0u);
    ASSERT_THROWS(EvalTree(std::string(50000, '-') + "1"), ParseError);

    // Скобки сами по себе глубину не добавляют
    ASSERT_EQ(EvalTree(std::string(5000, '(') + "7" + std::string(5000, ')')).evaluate(random), Number(7));
}

void test_tree_addition() {
    EvalTree rolled("2d20");
    EvalTree bonus("5+3");
    EvalTree expected(node("+", node("d", leaf(2), leaf(20)), node("+", leaf(5), leaf(3))));

    EvalTree combined = rolled + bonus;
    ASSERT(combined == expected);

    // Исходные деревья не затрагиваются вычислением результата
    ScriptedRandom random;
    combined.evaluate(random);
    ASSERT(rolled == EvalTree(node("d", leaf(2), leaf(20))));
    ASSERT(nothingEvaluated(rolled));
    ASSERT(nothingEvaluated(bonus));

    rolled += std::move(bonus);
    ASSERT(rolled == expected);
    ASSERT(bonus.empty());

    ASSERT_THROWS(rolled.absorb(getOperator("!"), EvalTree(Number(1))), std::invalid_argument);
}

void test_tree_subtraction() {
    EvalTree rolled("2d20");
    EvalTree bonus("5+3");
    EvalTree expected(node("-", node("d", leaf(2), leaf(20)), node("+", leaf(5), leaf(3))));

    EvalTree combined = rolled - bonus;
    ASSERT(combined == expected);

    ScriptedRandom random;
    combined.evaluate(random);
    ASSERT(nothingEvaluated(rolled));

    rolled -= std::move(bonus);
    ASSERT(rolled == expected);

    // Пустое дерево участвует как 0
    EvalTree empty;
    empty += EvalTree(Number(3));
    ASSERT(empty == EvalTree(node("+", leaf(0), leaf(3))));
}

void test_tree_evaluation() {
    ScriptedRandom random;
    ASSERT_EQ(EvalTree("3d4").evaluate(random), Number(12));
    ASSERT_EQ(EvalTree("4d6h3+2").evaluate(random), Number(14));
    ASSERT_EQ(EvalTree("1d20 >= 4").evaluate(random), Number(1));
    ASSERT_EQ(EvalTree("2dF").evaluate(random), Number(-2));
    ASSERT_EQ(EvalTree("7/2").evaluate(random), Number(3.5));
    ASSERT_EQ(EvalTree("2d(1d4)").evaluate(random), Number(8));
}

void test_tree_evaluation_failure() {
    ScriptedRandom random;
    ASSERT_THROWS(EvalTree("2d20h(7/2)").evaluate(random), EvaluationError);
    ASSERT_THROWS(EvalTree("1d0").evaluate(random), EvaluationError);
    ASSERT_THROWS(EvalTree("(-1)!").evaluate(random), EvaluationError);
    ASSERT_THROWS(EvalTree("1/0").evaluate(random), EvaluationError);
    ASSERT_THROWS(EvalTree("1d1R1").evaluate(random), EvaluationError);

    bool typeCause = false;
    try {
        EvalTree("2d20h(7/2)").evaluate(random);
    }
    catch (const EvaluationError& error) {
        try {
            std::rethrow_if_nested(error);
        }
        catch (const ArgumentTypeError&) {
            typeCause = true;
        }
    }
    ASSERT(typeCause);
}

void test_critify() {
    EvalTree tree = nestedRoll();
    tree.critify();
    ASSERT_EQ(tree.root()->op()->code, "dc");
    ASSERT_EQ(tree.root()->right()->op()->code, "dc");

    EvalTree averaged = nestedRoll();
    averaged.averageify().critify();
    ASSERT_EQ(averaged.root()->op()->code, "dc");
}

void test_maxify() {
    EvalTree tree = nestedRoll();
    tree.maxify();
    ASSERT_EQ(tree.root()->op()->code, "dm");
    ASSERT_EQ(tree.root()->right()->op()->code, "dm");

    EvalTree critical = nestedRoll();
    critical.critify().maxify();
    ASSERT(critical == tree);
}

void test_averageify() {
    EvalTree tree = nestedRoll();
    tree.averageify();
    ASSERT_EQ(tree.root()->op()->code, "da");
    ASSERT_EQ(tree.root()->right()->op()->code, "da");

    // Среднее не ослабляет крит
    EvalTree critical = nestedRoll();
    critical.critify().averageify();
    ASSERT_EQ(critical.root()->op()->code, "dc");
}

void test_is_critical() {
    ScriptedRandom first({1, 20, 1, 20, 1, 20});
    EvalTree kept("2d20h1");
    kept.evaluate(first);
    ASSERT(kept.isCritical());
    ASSERT(!kept.isFail());

    ScriptedRandom second({1, 20, 1, 20, 1, 20});
    EvalTree middle("10d20h5l2");
    middle.evaluate(second);
    ASSERT(!middle.isCritical());
    ASSERT(!middle.isFail());
}

void test_is_fail() {
    ScriptedRandom first({1, 20, 1, 20, 1, 20});
    EvalTree low("2d20l1");
    low.evaluate(first);
    ASSERT(low.isFail());
    ASSERT(!low.isCritical());

    ScriptedRandom second({1, 20, 1, 20, 1, 20});
    EvalTree both("1d20 + 1d20");
    both.evaluate(second);
    ASSERT(both.isFail());
    ASSERT(both.isCritical());

    EvalTree unevaluated("1d20");
    ASSERT(!unevaluated.isFail());
}

void test_tree_copy() {
    ScriptedRandom random;
    EvalTree tree = nestedRoll();
    tree.evaluate(random);

    EvalTree copy = tree.copy();
    ASSERT(copy == tree);

    std::vector<EvalTreeNode*> original = tree.preOrder();
    std::vector<EvalTreeNode*> copied = copy.preOrder();
    ASSERT_EQ(original.size(), copied.size());
    for (std::size_t i = 0; i < original.size(); ++i) {
        ASSERT(original[i] != copied[i]);
        ASSERT(copied[i]->value() != nullptr);
        ASSERT(original[i]->value() != copied[i]->value());
        ASSERT(*original[i]->value() == *copied[i]->value());
    }

    copy.maxify();
    ASSERT_EQ(tree.root()->op()->code, "d");
}

void test_verbose_result() {
    ScriptedRandom random({1, 20, 1, 20});
    EvalTree sum(node("+", leaf(1), node("d", leaf(4), leaf(20))));
    ASSERT_EQ(sum.verboseResult(random), "1+[d20: 1, 1, 20, 20] = 43");

    ASSERT_EQ(EvalTree().verboseResult(random), "");

    // ! вычисляется до вывода из-за высокого приоритета
    EvalTree negated(node("m", nullptr, node("!", leaf(5), nullptr)));
    ASSERT_EQ(negated.verboseResult(random), "-120 = -120");
}

void test_verbose_parentheses() {
    ScriptedRandom random;
    ASSERT_EQ(EvalTree("1+2*4").verboseResult(random), "1+2*4 = 9");
    ASSERT_EQ(EvalTree("(1+2)*3").verboseResult(random), "(1+2)*3 = 9");
    ASSERT_EQ(EvalTree("2d6+1").verboseResult(random), "[d6: 4, 4]+1 = 9");
    ASSERT_EQ(EvalTree("4d6h3").verboseResult(random), "[d6: 4, 4, 4; (4)] = 12");
    ASSERT_EQ(EvalTree("2*(1d4)").verboseResult(random), "2*[d4: 4] = 8");
}

void test_verbose_uses_previous_rolls() {
    ScriptedRandom first({17});
    EvalTree tree("1d20");
    ASSERT_EQ(tree.evaluate(first), Number(17));

    ScriptedRandom second({3});
    ASSERT_EQ(tree.verboseResult(second), "[d20: 17] = 17");
    ASSERT(second.requests.empty());
}

void tree_tests() {
    RUN_TEST(test_tree_nodes);
    RUN_TEST(test_tree_prefab);
    RUN_TEST(test_tree_simple_parse);
    RUN_TEST(test_tree_precedence);
    RUN_TEST(test_tree_associativity);
    RUN_TEST(test_tree_prefix_after_operator);
    RUN_TEST(test_tree_parentheses);
    RUN_TEST(test_tree_parse_errors);
    RUN_TEST(test_tree_missing_operand_side);
    RUN_TEST(test_tree_depth_limit);
    RUN_TEST(test_tree_addition);
    RUN_TEST(test_tree_subtraction);
    RUN_TEST(test_tree_evaluation);
    RUN_TEST(test_tree_evaluation_failure);
    RUN_TEST(test_critify);
    RUN_TEST(test_maxify);
    RUN_TEST(test_averageify);
    RUN_TEST(test_is_critical);
    RUN_TEST(test_is_fail);
    RUN_TEST(test_tree_copy);
    RUN_TEST(test_verbose_result);
    RUN_TEST(test_verbose_parentheses);
    RUN_TEST(test_verbose_uses_previous_rolls);
}
