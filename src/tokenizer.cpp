#include "tokenizer.hpp"

#include "errors.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <stdexcept>

namespace dice {

namespace {
// Фадж-кость: грани -1, 0 и 1
const Faces kFudgeFaces = {Number(-1), Number(0), Number(1)};

bool isDigit(char ch) {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

bool isSpace(char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}
}

Tokenizer::Tokenizer(std::string sourceText) : source(std::move(sourceText)) {}

// Основной цикл разбора: проходит по строке и выделяет токены
std::vector<Token> Tokenizer::tokenize() {
    checkParentheses();

    tokens.clear();
    numberRun.clear();
    operatorRun.clear();
    index = 0;

    while (!isAtEnd()) {
        char ch = peek();
        if (isDigit(ch)) {
            // Цифра завершает оператор и продолжает число
            flushOperator();
            if (numberRun.empty()) {
                numberStart = index;
            }
            numberRun += advance();
        } else if (ch == '(' || ch == ')') {
            readParenthesis();
        } else if (isOperatorChar(ch)) {
            flushNumber();
            readOperatorChar();
        } else if (ch == '[') {
            readSideList();
        } else if (ch == 'F') {
            readFudge();
        } else if (isSpace(ch)) {
            flushNumber();
            flushOperator();
            advance();
        } else {
            fail("Недопустимый символ", index);
        }
    }

    flushNumber();
    flushOperator();
    return tokens;
}

bool Tokenizer::isAtEnd() const {
    return index >= source.size();
}

char Tokenizer::peek() const {
    return source[index];
}

char Tokenizer::advance() {
    return source[index++];
}

// Незакрытая скобка указывается по первой непарной "(",
// лишняя закрывающая по своей позиции
void Tokenizer::checkParentheses() const {
    std::vector<std::size_t> open;
    for (std::size_t i = 0; i < source.size(); ++i) {
        if (source[i] == '(') {
            open.push_back(i);
        } else if (source[i] == ')') {
            if (open.empty()) {
                fail("Закрывающая скобка без открывающей", i);
            }
            open.pop_back();
        }
    }
    if (!open.empty()) {
        fail("Незакрытая скобка", open.front());
    }
}

void Tokenizer::flushNumber() {
    if (numberRun.empty()) {
        return;
    }
    long long value = 0;
    auto [end, error] = std::from_chars(numberRun.data(), numberRun.data() + numberRun.size(), value);
    if (error != std::errc() || end != numberRun.data() + numberRun.size()) {
        fail("Слишком большое число: " + numberRun, numberStart);
    }
    tokens.push_back(makeNumberToken(Number(value), numberStart));
    numberRun.clear();
}

void Tokenizer::flushOperator() {
    if (operatorRun.empty()) {
        return;
    }
    const Operator* op = findLexeme(operatorRun);
    if (op == nullptr) {
        fail("Неизвестный оператор: " + operatorRun, operatorStart);
    }
    tokens.push_back(makeOperatorToken(*op, operatorStart));
    operatorRun.clear();
}

// Знак стоит в начале выражения, после открывающей скобки
// или после оператора, которому нужен правый операнд
bool Tokenizer::signExpected() const {
    if (tokens.empty()) {
        return true;
    }
    const Token& last = tokens.back();
    if (last.type == TokenType::LParen) {
        return true;
    }
    return last.type == TokenType::Operator && last.op->takesRight();
}

bool Tokenizer::diceOperatorBefore() const {
    if (!numberRun.empty()) {
        return false;
    }
    if (!operatorRun.empty()) {
        const Operator* op = findLexeme(operatorRun);
        return op != nullptr && isDiceOperator(*op);
    }
    return !tokens.empty() && tokens.back().type == TokenType::Operator && isDiceOperator(*tokens.back().op);
}

void Tokenizer::readParenthesis() {
    flushNumber();
    flushOperator();

    bool open = peek() == '(';
    if (!tokens.empty() && tokens.back().type == TokenType::Operator) {
        // ")" сразу после оператора без правого операнда или "(" после постфиксного "!"
        const Operator& last = *tokens.back().op;
        if (open != last.takesRight()) {
            fail("Выражение неожиданно оборвалось", index);
        }
    }

    tokens.push_back(makeParenToken(open, index));
    advance();
}

void Tokenizer::readOperatorChar() {
    char ch = peek();
    if (ch == '+' || ch == '-') {
        flushOperator();
        if (signExpected()) {
            tokens.push_back(makeOperatorToken(ch == '+' ? "p" : "m", index));
        } else {
            operatorRun = ch;
            operatorStart = index;
        }
        advance();
        return;
    }

    // Жадно собираем самый длинный оператор: "<" и "=" дают "<="
    if (!operatorRun.empty() && isOperatorPrefix(operatorRun + ch)) {
        operatorRun += ch;
    } else {
        flushOperator();
        operatorRun = ch;
        operatorStart = index;
    }
    advance();
}

// Список граней вида [1, 3.5, 5] сразу после оператора броска
void Tokenizer::readSideList() {
    std::size_t begin = index;
    if (!diceOperatorBefore()) {
        fail("Список граней может стоять только после оператора броска", begin);
    }
    flushOperator();

    std::size_t close = source.find(']', begin);
    if (close == std::string::npos) {
        fail("Список граней не завершён", begin);
    }

    Faces faces;
    std::size_t elementStart = begin + 1;
    while (elementStart <= close) {
        std::size_t comma = source.find(',', elementStart);
        std::size_t elementEnd = (comma == std::string::npos || comma > close) ? close : comma;

        std::size_t first = elementStart;
        while (first < elementEnd && isSpace(source[first])) {
            ++first;
        }
        std::size_t last = elementEnd;
        while (last > first && isSpace(source[last - 1])) {
            --last;
        }

        std::string text = source.substr(first, last - first);
        const std::string error = "Грань \"" + text + "\" не является числом";
        double value = 0.0;
        std::size_t used = 0;
        try {
            value = std::stod(text, &used);
        } catch (const std::logic_error&) {
            fail(error, first);
        }
        if (used != text.size() || !std::isfinite(value)) {
            fail(error, first);
        }
        faces.push_back(Number(value));

        elementStart = elementEnd + 1;
    }

    tokens.push_back(makeFacesToken(std::move(faces), begin));
    index = close + 1;
}

void Tokenizer::readFudge() {
    if (!diceOperatorBefore()) {
        fail("F обозначает фадж-кость и может стоять только после оператора броска", index);
    }
    flushOperator();
    tokens.push_back(makeFacesToken(kFudgeFaces, index));
    advance();
}

void Tokenizer::fail(const std::string& message, std::size_t offset) const {
    throw ParseError(message, offset, source);
}

std::vector<Token> tokenize(const std::string& source) {
    Tokenizer tokenizer(source);
    return tokenizer.tokenize();
}

} // namespace dice
