#include "errors.hpp"

namespace dice {

namespace {
// Отступ строки выражения в тексте ошибки
constexpr std::size_t kIndent = 4;

// Сообщение, исходная строка и указатель ^ под ошибочным символом
std::string renderParseError(const std::string& message, std::size_t offset, const std::string& source) {
    const std::string indent(kIndent, ' ');
    return message + "\n" + indent + source + "\n" + indent + std::string(offset, ' ') + "^";
}
}

ParseError::ParseError(std::string message, std::size_t offset, std::string source)
    : RollError(renderParseError(message, offset, source)),
      text(std::move(message)),
      position(offset),
      expression(std::move(source)) {}

} // namespace dice
