#include "roller.hpp"

#include "errors.hpp"
#include "tokenizer.hpp"

#include <cctype>

namespace dice {

namespace {
// Дерево из любого допустимого выражения; готовое дерево копируется
EvalTree buildTree(const Rollable& expression) {
    if (const auto* source = std::get_if<std::string>(&expression)) {
        return EvalTree(*source);
    }
    if (const auto* number = std::get_if<Number>(&expression)) {
        return EvalTree(*number);
    }
    return std::get<EvalTree>(expression).copy();
}

void applyMode(EvalTree& tree, Mode mode) {
    switch (mode) {
    case Mode::Average:
        tree.averageify();
        break;
    case Mode::Crit:
        tree.critify();
        break;
    case Mode::Max:
        tree.maxify();
        break;
    case Mode::Normal:
        break;
    }
}

// Модификатор вешается на корень, чтобы прибавиться в самом конце
void addModifiers(EvalTree& tree, const Number& modifiers) {
    if (modifiers == Number(0)) {
        return;
    }
    tree.absorb(getOperator("+"), EvalTree(modifiers));
}
}

Mode modeFromString(const std::string& text) {
    std::string lowered = text;
    for (char& ch : lowered) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    if (lowered == "average") {
        return Mode::Average;
    }
    if (lowered == "critical") {
        return Mode::Crit;
    }
    if (lowered == "maximum") {
        return Mode::Max;
    }
    return Mode::Normal;
}

// Число не требует дерева и просто складывается с модификатором
Number Roller::basic(const Rollable& expression, Mode mode, const Number& modifiers) const {
    if (const auto* number = std::get_if<Number>(&expression)) {
        return *number + modifiers;
    }
    EvalTree tree = buildTree(expression);
    applyMode(tree, mode);
    return tree.evaluate(random) + modifiers;
}

std::string Roller::verbose(const Rollable& expression, Mode mode, const Number& modifiers) const {
    EvalTree tree = buildTree(expression);
    applyMode(tree, mode);
    addModifiers(tree, modifiers);
    tree.evaluate(random);
    return tree.verboseResult(random);
}

EvalTree Roller::compile(const Rollable& expression, const Number& modifiers) const {
    if (std::holds_alternative<EvalTree>(expression)) {
        throw InputTypeError("Скомпилировать можно только строку выражения или число");
    }
    EvalTree tree = buildTree(expression);
    addModifiers(tree, modifiers);
    return tree;
}

std::vector<Token> Roller::tokenize(const Rollable& expression, const Number& modifiers) const {
    if (std::holds_alternative<EvalTree>(expression)) {
        throw InputTypeError("Разбить на токены можно только строку выражения или число");
    }

    bool modified = !(modifiers == Number(0));
    std::vector<Token> tokens;
    if (const auto* number = std::get_if<Number>(&expression)) {
        tokens.push_back(makeNumberToken(*number));
        if (modified) {
            tokens.push_back(makeOperatorToken("+"));
            tokens.push_back(makeNumberToken(modifiers));
        }
        return tokens;
    }

    if (modified) {
        tokens.push_back(makeParenToken(true));
    }
    for (Token& token : dice::tokenize(std::get<std::string>(expression))) {
        tokens.push_back(std::move(token));
    }
    if (modified) {
        tokens.push_back(makeParenToken(false));
        tokens.push_back(makeOperatorToken("+"));
        tokens.push_back(makeNumberToken(modifiers));
    }
    return tokens;
}

Number rollBasic(const Rollable& expression, Mode mode, const Number& modifiers) {
    return Roller().basic(expression, mode, modifiers);
}

std::string rollVerbose(const Rollable& expression, Mode mode, const Number& modifiers) {
    return Roller().verbose(expression, mode, modifiers);
}

EvalTree compile(const Rollable& expression, const Number& modifiers) {
    return Roller().compile(expression, modifiers);
}

} // namespace dice
