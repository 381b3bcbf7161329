#include "value.hpp"

namespace dice {

std::string toString(const Value& value) {
    if (const auto* number = std::get_if<Number>(&value)) {
        return number->toString();
    }
    if (const auto* faces = std::get_if<Faces>(&value)) {
        return Die(*faces).toString();
    }
    return std::get<Roll>(value).toString();
}

Number collapse(const Value& value) {
    if (const auto* number = std::get_if<Number>(&value)) {
        return *number;
    }
    if (const auto* faces = std::get_if<Faces>(&value)) {
        Number total(0);
        for (const Number& face : *faces) {
            total = total + face;
        }
        return total;
    }
    return std::get<Roll>(value).sum();
}

} // namespace dice
