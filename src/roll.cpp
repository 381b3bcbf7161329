#include "roll.hpp"

#include "errors.hpp"

#include <algorithm>

namespace dice {

namespace {
std::string joinValues(const std::vector<Number>& values) {
    std::string text;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            text += ", ";
        }
        text += values[i].toString();
    }
    return text;
}

const Number& extremeFace(const Faces& faces, bool largest) {
    if (faces.empty()) {
        throw ArgumentValueError("У кости нет ни одной грани");
    }
    return largest ? *std::max_element(faces.begin(), faces.end())
                   : *std::min_element(faces.begin(), faces.end());
}
}

Number Die::minimum() const {
    return explicitFaces ? extremeFace(faceValues, false) : Number(1);
}

Number Die::maximum() const {
    return explicitFaces ? extremeFace(faceValues, true) : Number(sideCount);
}

std::string Die::toString() const {
    if (!explicitFaces) {
        return std::to_string(sideCount);
    }
    // Кортеж из одного элемента записывается с запятой: (4.0,)
    if (faceValues.size() == 1) {
        return "(" + faceValues.front().toString() + ",)";
    }
    return "(" + joinValues(faceValues) + ")";
}

bool operator==(const Die& left, const Die& right) {
    if (left.hasFaces() != right.hasFaces()) {
        return false;
    }
    return left.hasFaces() ? left.faces() == right.faces() : left.sides() == right.sides();
}

Roll::SortingSuspension::SortingSuspension(Roll& roll) : roll(&roll), previous(roll.sortingSuspended) {
    roll.sortingSuspended = true;
}

Roll::SortingSuspension::SortingSuspension(SortingSuspension&& other) noexcept
    : roll(other.roll), previous(other.previous) {
    other.roll = nullptr;
}

Roll::SortingSuspension::~SortingSuspension() {
    if (roll != nullptr) {
        roll->sortingSuspended = previous;
        roll->sortIfEnabled();
    }
}

Roll::Roll(std::vector<Number> rolls, Die die) : values(std::move(rolls)), dieSpec(std::move(die)) {
    sortIfEnabled();
}

void Roll::setRolls(std::vector<Number> rolls) {
    values = std::move(rolls);
    sortIfEnabled();
}

void Roll::addDiscards(const std::vector<Number>& removed) {
    dropped.insert(dropped.end(), removed.begin(), removed.end());
}

const Number& Roll::at(std::size_t index) const {
    checkIndex(index);
    return values[index];
}

void Roll::set(std::size_t index, Number value) {
    checkIndex(index);
    values[index] = value;
    sortIfEnabled();
}

void Roll::erase(std::size_t index) {
    checkIndex(index);
    values.erase(values.begin() + static_cast<std::ptrdiff_t>(index));
}

void Roll::discard(std::size_t index) {
    checkIndex(index);
    dropped.push_back(values[index]);
    values.erase(values.begin() + static_cast<std::ptrdiff_t>(index));
}

void Roll::discard(std::size_t first, std::size_t last) {
    checkRange(first, last);
    auto begin = values.begin() + static_cast<std::ptrdiff_t>(first);
    auto end = values.begin() + static_cast<std::ptrdiff_t>(last);
    dropped.insert(dropped.end(), begin, end);
    values.erase(begin, end);
}

void Roll::replace(std::size_t index, Number value) {
    checkIndex(index);
    dropped.push_back(values[index]);
    values[index] = value;
    sortIfEnabled();
}

void Roll::replace(std::size_t first, std::size_t last, const std::vector<Number>& replacement) {
    checkRange(first, last);
    if (last - first != replacement.size()) {
        throw ArgumentValueError("Диапазон можно заменить только списком той же длины");
    }
    dropped.insert(dropped.end(), values.begin() + static_cast<std::ptrdiff_t>(first),
                   values.begin() + static_cast<std::ptrdiff_t>(last));
    std::copy(replacement.begin(), replacement.end(), values.begin() + static_cast<std::ptrdiff_t>(first));
    sortIfEnabled();
}

bool Roll::contains(const Number& value) const {
    return std::find(values.begin(), values.end(), value) != values.end();
}

Number Roll::sum() const {
    Number total(0);
    for (const Number& value : values) {
        total = total + value;
    }
    return total;
}

std::string Roll::toString() const {
    std::string text = "[d" + dieSpec.toString() + ": " + joinValues(values);
    if (!dropped.empty()) {
        text += "; (" + joinValues(dropped) + ")";
    }
    return text + "]";
}

void Roll::checkIndex(std::size_t index) const {
    if (index >= values.size()) {
        throw ArgumentValueError("Индекс " + std::to_string(index) + " вне диапазона броска");
    }
}

void Roll::checkRange(std::size_t first, std::size_t last) const {
    if (first > last || last > values.size()) {
        throw ArgumentValueError("Диапазон [" + std::to_string(first) + "; " + std::to_string(last) +
                                 ") вне диапазона броска");
    }
}

void Roll::sortIfEnabled() {
    if (!sortingSuspended) {
        std::sort(values.begin(), values.end(),
                  [](const Number& left, const Number& right) { return left < right; });
    }
}

bool operator==(const Roll& left, const Roll& right) {
    return left.rolls() == right.rolls() && left.die() == right.die() && left.discards() == right.discards();
}

std::ostream& operator<<(std::ostream& stream, const Roll& roll) {
    return stream << roll.toString();
}

} // namespace dice
