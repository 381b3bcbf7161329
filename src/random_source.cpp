#include "random_source.hpp"

namespace dice {

MersenneRandomSource::MersenneRandomSource() : engine(std::random_device{}()) {}

MersenneRandomSource::MersenneRandomSource(std::mt19937::result_type seed) : engine(seed) {}

long long MersenneRandomSource::uniformInt(long long low, long long high) {
    if (low > high) {
        throw ArgumentValueError("Пустой диапазон случайных чисел: [" + std::to_string(low) + "; " +
                                 std::to_string(high) + "]");
    }
    std::uniform_int_distribution<long long> distribution(low, high);
    return distribution(engine);
}

std::size_t MersenneRandomSource::pickIndex(std::size_t count) {
    if (count == 0) {
        throw ArgumentValueError("Нельзя выбрать значение из пустого списка");
    }
    std::uniform_int_distribution<std::size_t> distribution(0, count - 1);
    return distribution(engine);
}

RandomSource& defaultRandomSource() {
    static MersenneRandomSource source;
    return source;
}

} // namespace dice
