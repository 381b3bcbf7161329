#pragma once

#include <cstddef>
#include <random>
#include <vector>

#include "errors.hpp"

namespace dice {

// Источник случайных чисел для бросков костей.
// Все операторы получают его по ссылке, поэтому в тестах его можно
// заменить детерминированной реализацией.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Равномерно распределённое целое из отрезка [low; high]
    virtual long long uniformInt(long long low, long long high) = 0;

    // Равномерно распределённый индекс из [0; count)
    virtual std::size_t pickIndex(std::size_t count) = 0;

    // Случайный элемент непустой последовательности
    template <typename T>
    const T& choice(const std::vector<T>& values) {
        if (values.empty()) {
            throw ArgumentValueError("Нельзя выбрать значение из пустого списка");
        }
        return values[pickIndex(values.size())];
    }
};

// Источник на основе вихря Мерсенна
class MersenneRandomSource final : public RandomSource {
public:
    // Начальное значение берётся из std::random_device
    MersenneRandomSource();
    explicit MersenneRandomSource(std::mt19937::result_type seed);

    long long uniformInt(long long low, long long high) override;
    std::size_t pickIndex(std::size_t count) override;

private:
    std::mt19937 engine;
};

// Общий источник процесса, используется по умолчанию
RandomSource& defaultRandomSource();

} // namespace dice
