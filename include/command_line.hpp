#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "roller.hpp"

// Параметры запуска, полученные из командной строки
struct RollOptions {
    dice::Mode mode = dice::Mode::Normal;
    std::size_t number = 1; // Сколько раз бросать каждое выражение
    bool verbose = false;   // Показывать выпавшие значения
    std::size_t wrap = 80;  // Ширина строки вывода, 0 отключает перенос
    bool help = false;
    std::vector<std::string> expressions;
};

// Безопасный парсинг числа из строки
std::size_t parseNumber(const std::string& value, bool allowZero = false);

// Разбор аргументов (без имени программы).
// Выбрасывает std::runtime_error при неизвестном флаге или некорректном значении.
RollOptions parseArguments(const std::vector<std::string>& arguments);

// Справка по флагам
void printUsage(std::ostream& output);

// Бросает каждое выражение options.number раз; результаты одного выражения
// выводятся в строку через пробел с переносом по ширине options.wrap
void runRolls(const RollOptions& options, const dice::Roller& roller, std::ostream& output);
