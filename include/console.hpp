#pragma once

#include <exception>
#include <iostream>
#include <string>

// ANSI цветовые коды для вывода в терминал
namespace Color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* CYAN = "\033[36m";
}

// Вывод приветственного заголовка программы
void printHeader();

// Сообщение об ошибке в stderr, вложенные причины выводятся с отступом
void printError(const std::exception& error);
