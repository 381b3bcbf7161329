#include "operators.hpp"

#include "errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace dice {

namespace {
// Ограничение на количество костей в одном броске
constexpr long long kMaxDice = 100000;

// 171! уже не помещается в double
constexpr long long kMaxFactorial = 170;

std::string describe(const Value& value) {
    if (std::holds_alternative<Number>(value)) {
        return "число " + toString(value);
    }
    if (std::holds_alternative<Faces>(value)) {
        return "список граней " + toString(value);
    }
    return "бросок " + toString(value);
}

const Roll& rollArg(const Value& value, const std::string& role) {
    if (const auto* roll = std::get_if<Roll>(&value)) {
        return *roll;
    }
    throw ArgumentTypeError(role + " должен быть броском костей, получено: " + describe(value));
}

Number numberArg(const Value& value, const std::string& role) {
    if (const auto* number = std::get_if<Number>(&value)) {
        return *number;
    }
    throw ArgumentTypeError(role + " должен быть числом, получено: " + describe(value));
}

long long integerArg(const Value& value, const std::string& role) {
    Number number = numberArg(value, role);
    if (!number.isInteger()) {
        throw ArgumentTypeError(role + " должен быть целым числом, получено: " + number.toString());
    }
    return number.integer();
}

// Кость, заданная правым операндом оператора броска.
// Вложенный бросок (2d(1d4)) для d и dc задаёт число граней своей суммой,
// а для da и dm служит списком граней.
Die dieArg(const Value& value, bool rollAsFaces) {
    if (const auto* faces = std::get_if<Faces>(&value)) {
        return Die(*faces);
    }
    if (const auto* roll = std::get_if<Roll>(&value)) {
        if (rollAsFaces) {
            return Die(Faces(roll->rolls()));
        }
        Number total = roll->sum();
        if (!total.isInteger()) {
            throw ArgumentTypeError("Число граней кости должно быть целым, получено: " + total.toString());
        }
        return Die(total.integer());
    }
    return Die(integerArg(value, "Число граней кости"));
}

void checkDie(const Die& die) {
    if (die.hasFaces()) {
        if (die.faces().empty()) {
            throw ArgumentValueError("У кости нет ни одной грани");
        }
    } else if (die.sides() < 1) {
        throw ArgumentValueError("У кости должна быть хотя бы одна грань, получено: " +
                                 std::to_string(die.sides()));
    }
}

// Количество бросаемых костей; отрицательное значит ноль
std::size_t diceCount(long long count) {
    if (count > kMaxDice) {
        throw ArgumentValueError("Слишком много костей за один бросок: " + std::to_string(count) +
                                 " (не больше " + std::to_string(kMaxDice) + ")");
    }
    return count > 0 ? static_cast<std::size_t>(count) : 0;
}

bool equalTo(const Number& value, const Number& target) {
    return value == target;
}

bool greaterThan(const Number& value, const Number& target) {
    return value > target;
}

bool lessThan(const Number& value, const Number& target) {
    return value < target;
}

Number flag(bool condition) {
    return Number(condition ? 1 : 0);
}

// Обёртки, которые проверяют операнды и вызывают реализацию

Value factorialOp(const std::vector<Value>& operands, RandomSource&) {
    return ops::factorial(integerArg(operands[0], "Аргумент факториала"));
}

Value rollOp(const std::vector<Value>& operands, RandomSource& random) {
    return ops::rollBasic(integerArg(operands[0], "Количество костей"), dieArg(operands[1], false), random);
}

Value rollAverageOp(const std::vector<Value>& operands, RandomSource&) {
    return ops::rollAverage(integerArg(operands[0], "Количество костей"), dieArg(operands[1], true));
}

Value rollCriticalOp(const std::vector<Value>& operands, RandomSource& random) {
    return ops::rollCritical(integerArg(operands[0], "Количество костей"), dieArg(operands[1], false), random);
}

Value rollMaxOp(const std::vector<Value>& operands, RandomSource&) {
    return ops::rollMax(integerArg(operands[0], "Количество костей"), dieArg(operands[1], true));
}

Value takeHighOp(const std::vector<Value>& operands, RandomSource&) {
    return ops::takeHigh(rollArg(operands[0], "Операнд h"), integerArg(operands[1], "Количество оставляемых костей"));
}

Value takeLowOp(const std::vector<Value>& operands, RandomSource&) {
    return ops::takeLow(rollArg(operands[0], "Операнд l"), integerArg(operands[1], "Количество оставляемых костей"));
}

Value floorOp(const std::vector<Value>& operands, RandomSource&) {
    return ops::floorValue(rollArg(operands[0], "Операнд f"), numberArg(operands[1], "Нижняя граница"));
}

Value ceilOp(const std::vector<Value>& operands, RandomSource&) {
    return ops::ceilValue(rollArg(operands[0], "Операнд c"), numberArg(operands[1], "Верхняя граница"));
}

Value rerollOnceOnOp(const std::vector<Value>& operands, RandomSource& random) {
    return ops::rerollOnceOn(rollArg(operands[0], "Операнд r"), numberArg(operands[1], "Цель переброса"), random);
}

Value rerollOnceLowerOp(const std::vector<Value>& operands, RandomSource& random) {
    return ops::rerollOnceLower(rollArg(operands[0], "Операнд r<"), numberArg(operands[1], "Цель переброса"),
                                random);
}

Value rerollOnceHigherOp(const std::vector<Value>& operands, RandomSource& random) {
    return ops::rerollOnceHigher(rollArg(operands[0], "Операнд r>"), numberArg(operands[1], "Цель переброса"),
                                 random);
}

Value rerollUnconditionalOnOp(const std::vector<Value>& operands, RandomSource& random) {
    return ops::rerollUnconditionalOn(rollArg(operands[0], "Операнд R"), numberArg(operands[1], "Цель переброса"),
                                      random);
}

Value rerollUnconditionalLowerOp(const std::vector<Value>& operands, RandomSource& random) {
    return ops::rerollUnconditionalLower(rollArg(operands[0], "Операнд R<"),
                                         numberArg(operands[1], "Цель переброса"), random);
}

Value rerollUnconditionalHigherOp(const std::vector<Value>& operands, RandomSource& random) {
    return ops::rerollUnconditionalHigher(rollArg(operands[0], "Операнд R>"),
                                          numberArg(operands[1], "Цель переброса"), random);
}

Value thresholdLowerOp(const std::vector<Value>& operands, RandomSource&) {
    return ops::thresholdLower(rollArg(operands[0], "Операнд t"), integerArg(operands[1], "Порог"));
}

Value thresholdUpperOp(const std::vector<Value>& operands, RandomSource&) {
    return ops::thresholdUpper(rollArg(operands[0], "Операнд T"), integerArg(operands[1], "Порог"));
}

Value powerOp(const std::vector<Value>& operands, RandomSource&) {
    return power(numberArg(operands[0], "Основание"), numberArg(operands[1], "Показатель"));
}

Value negateOp(const std::vector<Value>& operands, RandomSource&) {
    return -numberArg(operands[0], "Операнд унарного минуса");
}

Value identityOp(const std::vector<Value>& operands, RandomSource&) {
    return numberArg(operands[0], "Операнд унарного плюса");
}

Value multiplyOp(const std::vector<Value>& operands, RandomSource&) {
    return numberArg(operands[0], "Левый операнд *") * numberArg(operands[1], "Правый операнд *");
}

Value divideOp(const std::vector<Value>& operands, RandomSource&) {
    return numberArg(operands[0], "Делимое") / numberArg(operands[1], "Делитель");
}

Value moduloOp(const std::vector<Value>& operands, RandomSource&) {
    return numberArg(operands[0], "Делимое") % numberArg(operands[1], "Делитель");
}

Value subtractOp(const std::vector<Value>& operands, RandomSource&) {
    return numberArg(operands[0], "Уменьшаемое") - numberArg(operands[1], "Вычитаемое");
}

Value addOp(const std::vector<Value>& operands, RandomSource&) {
    return numberArg(operands[0], "Левое слагаемое") + numberArg(operands[1], "Правое слагаемое");
}

Value greaterOp(const std::vector<Value>& operands, RandomSource&) {
    return flag(numberArg(operands[0], "Левый операнд") > numberArg(operands[1], "Правый операнд"));
}

Value greaterEqualOp(const std::vector<Value>& operands, RandomSource&) {
    return flag(numberArg(operands[0], "Левый операнд") >= numberArg(operands[1], "Правый операнд"));
}

Value lessOp(const std::vector<Value>& operands, RandomSource&) {
    return flag(numberArg(operands[0], "Левый операнд") < numberArg(operands[1], "Правый операнд"));
}

Value lessEqualOp(const std::vector<Value>& operands, RandomSource&) {
    return flag(numberArg(operands[0], "Левый операнд") <= numberArg(operands[1], "Правый операнд"));
}

Value equalOp(const std::vector<Value>& operands, RandomSource&) {
    return flag(numberArg(operands[0], "Левый операнд") == numberArg(operands[1], "Правый операнд"));
}

Value orOp(const std::vector<Value>& operands, RandomSource&) {
    return flag(numberArg(operands[0], "Левый операнд").truthy() || numberArg(operands[1], "Правый операнд").truthy());
}

Value andOp(const std::vector<Value>& operands, RandomSource&) {
    return flag(numberArg(operands[0], "Левый операнд").truthy() && numberArg(operands[1], "Правый операнд").truthy());
}

OperatorTable buildTable() {
    // Перечислены по убыванию приоритета
    const std::vector<Operator> operators = {
        {"!", 8, factorialOp, Side::Left, Side::Left, Side::Left},
        {"d", 7, rollOp, Side::Both, Side::Left, Side::Left},
        {"da", 7, rollAverageOp, Side::Both, Side::Left, Side::Left},
        {"dc", 7, rollCriticalOp, Side::Both, Side::Left, Side::Left},
        {"dm", 7, rollMaxOp, Side::Both, Side::Left, Side::Left},
        {"h", 6, takeHighOp, Side::Both, Side::Left, Side::Right},
        {"l", 6, takeLowOp, Side::Both, Side::Left, Side::Right},
        {"f", 6, floorOp, Side::Both, Side::Left, Side::Right},
        {"c", 6, ceilOp, Side::Both, Side::Left, Side::Right},
        {"r", 6, rerollOnceOnOp, Side::Both, Side::Left, Side::Right},
        {"R", 6, rerollUnconditionalOnOp, Side::Both, Side::Left, Side::Right},
        {"r<", 6, rerollOnceLowerOp, Side::Both, Side::Left, Side::Right},
        {"R<", 6, rerollUnconditionalLowerOp, Side::Both, Side::Left, Side::Right},
        {"rl", 6, rerollOnceLowerOp, Side::Both, Side::Left, Side::Right},
        {"Rl", 6, rerollUnconditionalLowerOp, Side::Both, Side::Left, Side::Right},
        {"r>", 6, rerollOnceHigherOp, Side::Both, Side::Left, Side::Right},
        {"R>", 6, rerollUnconditionalHigherOp, Side::Both, Side::Left, Side::Right},
        {"rh", 6, rerollOnceHigherOp, Side::Both, Side::Left, Side::Right},
        {"Rh", 6, rerollUnconditionalHigherOp, Side::Both, Side::Left, Side::Right},
        {"t", 6, thresholdLowerOp, Side::Both, Side::Left, Side::Right},
        {"T", 6, thresholdUpperOp, Side::Both, Side::Left, Side::Right},
        {"^", 5, powerOp, Side::Both, Side::Right, Side::Both},
        {"m", 4, negateOp, Side::Right, Side::Left, Side::Right, "-"},
        {"p", 4, identityOp, Side::Right, Side::Left, Side::Right, "+"},
        {"*", 3, multiplyOp},
        {"/", 3, divideOp},
        {"%", 3, moduloOp},
        {"-", 2, subtractOp},
        {"+", 2, addOp},
        {">", 1, greaterOp},
        {"gt", 1, greaterOp},
        {">=", 1, greaterEqualOp},
        {"ge", 1, greaterEqualOp},
        {"<", 1, lessOp},
        {"lt", 1, lessOp},
        {"<=", 1, lessEqualOp},
        {"le", 1, lessEqualOp},
        {"=", 1, equalOp},
        {"|", 1, orOp},
        {"&", 1, andOp},
    };

    OperatorTable table;
    for (const Operator& op : operators) {
        table.emplace(op.code, op);
    }
    return table;
}

// Знаки m и p появляются только из + и -, набрать их нельзя
bool isTypeable(const Operator& op) {
    return op.code != "m" && op.code != "p";
}
}

bool Operator::reducesBefore(const Operator& incoming) const {
    return precedence > incoming.precedence ||
           (precedence == incoming.precedence && associativity == Side::Left);
}

Value Operator::apply(const Value* left, const Value* right, RandomSource& random) const {
    std::vector<Value> operands;
    operands.reserve(2);
    if (takesLeft()) {
        if (left == nullptr) {
            throw std::invalid_argument("Оператору " + code + " не передан левый операнд");
        }
        operands.push_back(includes(cajole, Side::Left) ? Value(collapse(*left)) : *left);
    }
    if (takesRight()) {
        if (right == nullptr) {
            throw std::invalid_argument("Оператору " + code + " не передан правый операнд");
        }
        operands.push_back(includes(cajole, Side::Right) ? Value(collapse(*right)) : *right);
    }
    return function(operands, random);
}

bool operator==(const Operator& left, const Operator& right) {
    return left.code == right.code;
}

const OperatorTable& operatorTable() {
    static const OperatorTable table = buildTable();
    return table;
}

const Operator* findOperator(std::string_view code) {
    const auto& table = operatorTable();
    auto it = table.find(code);
    return it != table.end() ? &it->second : nullptr;
}

const Operator& getOperator(std::string_view code) {
    const Operator* op = findOperator(code);
    if (op == nullptr) {
        throw std::out_of_range("Неизвестный оператор: " + std::string(code));
    }
    return *op;
}

const Operator* findLexeme(std::string_view code) {
    const Operator* op = findOperator(code);
    return op != nullptr && isTypeable(*op) ? op : nullptr;
}

bool isOperatorPrefix(std::string_view text) {
    for (const auto& [code, op] : operatorTable()) {
        if (isTypeable(op) && std::string_view(code).substr(0, text.size()) == text) {
            return true;
        }
    }
    return false;
}

bool isOperatorChar(char ch) {
    static const std::string characters = [] {
        std::string all;
        for (const auto& [code, op] : operatorTable()) {
            if (isTypeable(op)) {
                all += code;
            }
        }
        return all;
    }();
    return characters.find(ch) != std::string::npos;
}

bool isDiceOperator(const Operator& op) {
    return op.code == "d" || op.code == "da" || op.code == "dc" || op.code == "dm";
}

namespace ops {

Roll thresholdLower(const Roll& roll, long long threshold) {
    std::vector<Number> successes;
    successes.reserve(roll.size());
    for (const Number& value : roll) {
        successes.push_back(flag(value >= Number(threshold)));
    }
    Roll modified(std::move(successes), roll.die());
    modified.addDiscards(roll.discards());
    modified.addDiscards(roll.rolls());
    return modified;
}

Roll thresholdUpper(const Roll& roll, long long threshold) {
    std::vector<Number> successes;
    successes.reserve(roll.size());
    for (const Number& value : roll) {
        successes.push_back(flag(value <= Number(threshold)));
    }
    Roll modified(std::move(successes), roll.die());
    modified.addDiscards(roll.discards());
    modified.addDiscards(roll.rolls());
    return modified;
}

Roll takeLow(const Roll& roll, long long count) {
    Roll copy = roll;
    std::size_t keep = count > 0 ? static_cast<std::size_t>(count) : 0;
    if (copy.size() > keep) {
        copy.discard(keep, copy.size());
    }
    return copy;
}

Roll takeHigh(const Roll& roll, long long count) {
    Roll copy = roll;
    std::size_t keep = count > 0 ? static_cast<std::size_t>(count) : 0;
    if (copy.size() > keep) {
        copy.discard(0, copy.size() - keep);
    }
    return copy;
}

Number singleDie(const Die& die, RandomSource& random) {
    checkDie(die);
    if (die.hasFaces()) {
        return random.choice(die.faces());
    }
    return Number(random.uniformInt(1, die.sides()));
}

Roll rollBasic(long long count, const Die& die, RandomSource& random) {
    std::size_t dice = diceCount(count);
    checkDie(die);
    std::vector<Number> rolls;
    rolls.reserve(dice);
    for (std::size_t i = 0; i < dice; ++i) {
        rolls.push_back(singleDie(die, random));
    }
    return Roll(std::move(rolls), die);
}

Roll rollCritical(long long count, const Die& die, RandomSource& random) {
    std::size_t dice = 2 * diceCount(count);
    checkDie(die);
    std::vector<Number> rolls;
    rolls.reserve(dice);
    for (std::size_t i = 0; i < dice; ++i) {
        rolls.push_back(singleDie(die, random));
    }
    return Roll(std::move(rolls), die);
}

Roll rollMax(long long count, const Die& die) {
    std::size_t dice = diceCount(count);
    checkDie(die);
    return Roll(std::vector<Number>(dice, die.maximum()), die);
}

Roll rollAverage(long long count, const Die& die) {
    std::size_t dice = diceCount(count);
    checkDie(die);
    Number average;
    if (die.hasFaces()) {
        Number total(0);
        for (const Number& face : die.faces()) {
            total = total + face;
        }
        average = total / Number(static_cast<long long>(die.faces().size()));
    } else {
        average = Number(die.sides() + 1) / Number(2);
    }
    return Roll(std::vector<Number>(dice, average), die);
}

Roll rerollOnce(const Roll& original, const Number& target, Comparison shouldReroll, RandomSource& random) {
    Roll modified = original;
    {
        auto suspension = modified.suspendSorting();
        for (std::size_t i = 0; i < original.size(); ++i) {
            if (shouldReroll(modified.at(i), target)) {
                modified.replace(i, singleDie(modified.die(), random));
            }
        }
    }
    return modified;
}

Roll rerollUnconditional(const Roll& original, const Number& target, Comparison shouldReroll,
                         RandomSource& random) {
    Roll modified = original;
    {
        auto suspension = modified.suspendSorting();
        for (std::size_t i = 0; i < original.size(); ++i) {
            while (shouldReroll(modified.at(i), target)) {
                modified.replace(i, singleDie(modified.die(), random));
            }
        }
    }
    return modified;
}

Roll rerollOnceOn(const Roll& original, const Number& target, RandomSource& random) {
    return rerollOnce(original, target, equalTo, random);
}

Roll rerollOnceHigher(const Roll& original, const Number& target, RandomSource& random) {
    return rerollOnce(original, target, greaterThan, random);
}

Roll rerollOnceLower(const Roll& original, const Number& target, RandomSource& random) {
    return rerollOnce(original, target, lessThan, random);
}

Roll rerollUnconditionalOn(const Roll& original, const Number& target, RandomSource& random) {
    const Die& die = original.die();
    checkDie(die);
    if (die.minimum() == target && die.maximum() == target) {
        throw ArgumentValueError("На кости " + die.toString() + " всегда выпадает " + target.toString() +
                                 ", переброс никогда не закончится");
    }
    return rerollUnconditional(original, target, equalTo, random);
}

Roll rerollUnconditionalHigher(const Roll& original, const Number& target, RandomSource& random) {
    const Die& die = original.die();
    checkDie(die);
    if (target < die.minimum()) {
        throw ArgumentValueError("На кости " + die.toString() + " не может выпасть значение меньше " +
                                 target.toString() + ", переброс никогда не закончится");
    }
    return rerollUnconditional(original, target, greaterThan, random);
}

Roll rerollUnconditionalLower(const Roll& original, const Number& target, RandomSource& random) {
    const Die& die = original.die();
    checkDie(die);
    if (target > die.maximum()) {
        throw ArgumentValueError("На кости " + die.toString() + " не может выпасть значение больше " +
                                 target.toString() + ", переброс никогда не закончится");
    }
    return rerollUnconditional(original, target, lessThan, random);
}

Roll floorValue(const Roll& original, const Number& bottom) {
    Roll modified = original;
    {
        auto suspension = modified.suspendSorting();
        for (std::size_t i = 0; i < modified.size(); ++i) {
            if (modified.at(i) < bottom) {
                modified.replace(i, bottom);
            }
        }
    }
    return modified;
}

Roll ceilValue(const Roll& original, const Number& top) {
    Roll modified = original;
    {
        auto suspension = modified.suspendSorting();
        for (std::size_t i = 0; i < modified.size(); ++i) {
            if (modified.at(i) > top) {
                modified.replace(i, top);
            }
        }
    }
    return modified;
}

Number factorial(long long number) {
    if (number < 0) {
        throw ArgumentValueError("Факториал не определён для отрицательных чисел");
    }
    if (number > kMaxFactorial) {
        throw ArgumentValueError("Факториал " + std::to_string(number) + " слишком велик");
    }
    Number result(1);
    for (long long i = 2; i <= number; ++i) {
        result = result * Number(i);
    }
    return result;
}

} // namespace ops

} // namespace dice
