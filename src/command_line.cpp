#include "command_line.hpp"

#include <cctype>
#include <stdexcept>

namespace {
// Флаги режима взаимоисключающие
void setMode(RollOptions& options, dice::Mode mode, bool& modeSet) {
    if (modeSet && options.mode != mode) {
        throw std::runtime_error("Флаги -a, -c и -m нельзя использовать вместе");
    }
    options.mode = mode;
    modeSet = true;
}

// Аргумент вида "-4+1d6" это выражение, а не флаг
bool isFlag(const std::string& argument) {
    return argument.size() > 1 && argument[0] == '-' &&
           (argument[1] == '-' || std::isalpha(static_cast<unsigned char>(argument[1])));
}

// Значение флага: "--wrap=40", "-w40" или следующий аргумент
std::string takeValue(const std::string& flag, const std::string& inlineValue,
                      const std::vector<std::string>& arguments, std::size_t& index) {
    if (!inlineValue.empty()) {
        return inlineValue;
    }
    if (index + 1 >= arguments.size()) {
        throw std::runtime_error("Флагу " + flag + " требуется значение");
    }
    return arguments[++index];
}
}

std::size_t parseNumber(const std::string& value, bool allowZero) {
    std::size_t result = 0;
    try {
        if (value.empty() || !std::isdigit(static_cast<unsigned char>(value[0]))) {
            throw std::invalid_argument(value);
        }
        std::size_t used = 0;
        result = std::stoul(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
    }
    catch (const std::logic_error&) {
        throw std::runtime_error("Некорректное числовое значение: " + value);
    }
    if (result == 0 && !allowZero) {
        throw std::runtime_error("Число должно быть положительным");
    }
    return result;
}

RollOptions parseArguments(const std::vector<std::string>& arguments) {
    RollOptions options;
    bool modeSet = false;
    bool onlyExpressions = false;

    for (std::size_t i = 0; i < arguments.size(); ++i) {
        const std::string& argument = arguments[i];

        if (onlyExpressions || !isFlag(argument)) {
            options.expressions.push_back(argument);
            continue;
        }
        if (argument == "--") {
            onlyExpressions = true;
            continue;
        }

        // Длинные флаги
        if (argument.rfind("--", 0) == 0) {
            std::string name = argument.substr(2);
            std::string inlineValue;
            std::size_t equals = name.find('=');
            if (equals != std::string::npos) {
                inlineValue = name.substr(equals + 1);
                name.erase(equals);
            }

            if (name == "average") {
                setMode(options, dice::Mode::Average, modeSet);
            } else if (name == "critical") {
                setMode(options, dice::Mode::Crit, modeSet);
            } else if (name == "maximum") {
                setMode(options, dice::Mode::Max, modeSet);
            } else if (name == "verbose") {
                options.verbose = true;
            } else if (name == "help") {
                options.help = true;
            } else if (name == "number") {
                options.number = parseNumber(takeValue(argument, inlineValue, arguments, i));
            } else if (name == "wrap") {
                options.wrap = parseNumber(takeValue(argument, inlineValue, arguments, i), true);
            } else {
                throw std::runtime_error("Неизвестный флаг: " + argument);
            }
            continue;
        }

        // Короткие флаги можно объединять: -vc, -vn5
        for (std::size_t j = 1; j < argument.size(); ++j) {
            char flag = argument[j];
            if (flag == 'a') {
                setMode(options, dice::Mode::Average, modeSet);
            } else if (flag == 'c') {
                setMode(options, dice::Mode::Crit, modeSet);
            } else if (flag == 'm') {
                setMode(options, dice::Mode::Max, modeSet);
            } else if (flag == 'v') {
                options.verbose = true;
            } else if (flag == 'h') {
                options.help = true;
            } else if (flag == 'n' || flag == 'w') {
                std::string value = takeValue(std::string("-") + flag, argument.substr(j + 1), arguments, i);
                if (flag == 'n') {
                    options.number = parseNumber(value);
                } else {
                    options.wrap = parseNumber(value, true);
                }
                break;
            } else {
                throw std::runtime_error(std::string("Неизвестный флаг: -") + flag);
            }
        }
    }

    if (!options.help && options.expressions.empty()) {
        throw std::runtime_error("Не указано ни одного выражения для броска");
    }
    return options;
}

void printUsage(std::ostream& output) {
    output << "Использование: dice_roller [-a|-c|-m] [-n N] [-v] [-w W] ВЫРАЖЕНИЕ...\n\n"
           << "Бросает кости по формуле вида 2d20h1+5, 8d6f2 или 1d100<=18.\n\n"
           << "  -a, --average    среднее значение броска\n"
           << "  -c, --critical   критическое попадание (вдвое больше костей)\n"
           << "  -m, --maximum    максимальное значение броска\n"
           << "  -n, --number N   бросить каждое выражение N раз (по умолчанию 1)\n"
           << "  -v, --verbose    показать выпавшие значения\n"
           << "  -w, --wrap W     переносить строки после W символов, 0 без переноса (по умолчанию 80)\n"
           << "  -h, --help       показать эту справку\n";
}

void runRolls(const RollOptions& options, const dice::Roller& roller, std::ostream& output) {
    for (const std::string& expression : options.expressions) {
        // Выражение разбирается один раз и бросается многократно
        dice::EvalTree compiled = roller.compile(expression);
        std::size_t length = 0;
        for (std::size_t i = 0; i < options.number; ++i) {
            std::string text = options.verbose ? roller.verbose(compiled, options.mode)
                                               : roller.basic(compiled, options.mode).toString();
            text += " ";
            if (options.wrap > 0) {
                // Перенос ставится перед результатом, который не помещается в строку
                if (length > 0 && length + text.size() > options.wrap) {
                    output << "\n";
                    length = 0;
                }
                length += text.size();
            }
            output << text;
        }
        output << "\n";
    }
}
