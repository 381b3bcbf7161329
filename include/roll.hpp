#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "number.hpp"

namespace dice {

// Явный список значений граней кости, например [1,3,5] или F = (-1, 0, 1)
using Faces = std::vector<Number>;

// Описание брошенной кости: число граней или явный список значений граней
class Die {
public:
    Die() = default;
    explicit Die(long long sides) : sideCount(sides) {}
    explicit Die(Faces faces) : faceValues(std::move(faces)), explicitFaces(true) {}

    bool hasFaces() const { return explicitFaces; }
    long long sides() const { return sideCount; }
    const Faces& faces() const { return faceValues; }

    // Наименьшее и наибольшее значение, которое может выпасть
    Number minimum() const;
    Number maximum() const;

    // "20" для обычной кости, "(-1, 0, 1)" или "(4.0,)" для списка граней
    std::string toString() const;

private:
    long long sideCount = 0;
    Faces faceValues;
    bool explicitFaces = false;
};

bool operator==(const Die& left, const Die& right);

// Набор результатов броска.
// Активные значения всегда отсортированы по возрастанию, кроме периода,
// когда сортировка приостановлена (переброс на месте опирается на индексы).
// Значения, убранные операторами, накапливаются в discards для подробного вывода.
class Roll {
public:
    // Снимает приостановку сортировки при выходе из области видимости
    class SortingSuspension {
    public:
        explicit SortingSuspension(Roll& roll);
        SortingSuspension(SortingSuspension&& other) noexcept;
        SortingSuspension(const SortingSuspension&) = delete;
        SortingSuspension& operator=(const SortingSuspension&) = delete;
        SortingSuspension& operator=(SortingSuspension&&) = delete;
        ~SortingSuspension();

    private:
        Roll* roll;
        bool previous;
    };

    Roll() = default;
    Roll(std::vector<Number> rolls, Die die);

    const std::vector<Number>& rolls() const { return values; }
    void setRolls(std::vector<Number> rolls);

    const std::vector<Number>& discards() const { return dropped; }
    void addDiscards(const std::vector<Number>& removed);

    const Die& die() const { return dieSpec; }

    std::size_t size() const { return values.size(); }
    bool empty() const { return values.empty(); }
    std::vector<Number>::const_iterator begin() const { return values.begin(); }
    std::vector<Number>::const_iterator end() const { return values.end(); }

    // Доступ по индексу. Выбрасывает ArgumentValueError при выходе за границы.
    const Number& at(std::size_t index) const;
    void set(std::size_t index, Number value);
    void erase(std::size_t index);

    // Убирает значение (или полуинтервал [first; last)) в discards
    void discard(std::size_t index);
    void discard(std::size_t first, std::size_t last);

    // Заменяет значение, старое уходит в discards.
    // Диапазон заменяется только списком той же длины.
    void replace(std::size_t index, Number value);
    void replace(std::size_t first, std::size_t last, const std::vector<Number>& replacement);

    bool contains(const Number& value) const;

    // Сумма активных значений
    Number sum() const;

    // "[d6: 1, 4, 6]" или "[d6: 4, 6; (1)]" при наличии отброшенных значений
    std::string toString() const;

    [[nodiscard]] SortingSuspension suspendSorting() { return SortingSuspension(*this); }

private:
    std::vector<Number> values;
    Die dieSpec;
    std::vector<Number> dropped;
    bool sortingSuspended = false;

    void checkIndex(std::size_t index) const;
    void checkRange(std::size_t first, std::size_t last) const;
    void sortIfEnabled();
};

bool operator==(const Roll& left, const Roll& right);

std::ostream& operator<<(std::ostream& stream, const Roll& roll);

} // namespace dice
