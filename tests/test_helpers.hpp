#pragma once

#include <cstddef>
#include <initializer_list>
#include <utility>
#include <vector>

#include "random_source.hpp"
#include "roll.hpp"

// Детерминированный источник: отдаёт значения из сценария по порядку,
// после его окончания всегда fallback. Отрезок броска не учитывается.
class ScriptedRandom final : public dice::RandomSource {
public:
    explicit ScriptedRandom(std::vector<long long> script = {}, long long fallback = 4, std::size_t pick = 0)
        : script(std::move(script)), fallback(fallback), pick(pick) {}

    long long uniformInt(long long low, long long high) override {
        requests.emplace_back(low, high);
        return next < script.size() ? script[next++] : fallback;
    }

    // Всегда один и тот же индекс, но не дальше последнего элемента
    std::size_t pickIndex(std::size_t count) override {
        ++picks;
        return pick < count ? pick : count - 1;
    }

    std::vector<std::pair<long long, long long>> requests; // Запрошенные отрезки
    std::size_t picks = 0;

private:
    std::vector<long long> script;
    std::size_t next = 0;
    long long fallback;
    std::size_t pick;
};

inline std::vector<dice::Number> nums(std::initializer_list<dice::Number> values) {
    return std::vector<dice::Number>(values);
}

inline dice::Faces faces(std::initializer_list<dice::Number> values) {
    return dice::Faces(values);
}
