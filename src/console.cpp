#include "console.hpp"

#include <exception>

namespace {
void printCauses(const std::exception& error, int depth) {
    try {
        std::rethrow_if_nested(error);
    }
    catch (const std::exception& cause) {
        std::cerr << std::string(2 * depth, ' ') << Color::RED << "причина: " << cause.what() << Color::RESET
            << "\n";
        printCauses(cause, depth + 1);
    }
}
}

// Вывод приветственного заголовка программы
void printHeader() {
    std::cout << Color::BOLD << Color::CYAN;
    std::cout << "\n╔═══════════════════════════════════════════════════════════╗\n";
    std::cout << "║          Бросок костей по формуле v1.0                    ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════╝\n";
    std::cout << Color::RESET << "\n";
}

void printError(const std::exception& error) {
    std::cerr << Color::RED << Color::BOLD << "✗ Ошибка: "
        << Color::RESET << Color::RED << error.what() << Color::RESET << "\n";
    printCauses(error, 1);
}
