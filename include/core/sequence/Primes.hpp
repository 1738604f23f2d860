#pragma once

#include <optional>
#include <string>
#include "core/sequence/ISequenceStrategy.hpp"

namespace mathmachine {
namespace core {
namespace sequence {

// Primes — N-е простое число, нумерация с 1: P(1)=2, P(2)=3, P(10)=29.
// P(0) и отрицательные индексы — InvalidIndex. Поиск продолжается от ближайшего
// закэшированного P(k), k < n, найденного через lookup сверху вниз.
class Primes final : public ISequenceStrategy<IntValue> {
public:
    IntValue compute(Index n, const LookupType& lookup) const override;
    std::string name() const override { return "primes"; }

    // Проверка простоты делением на 2, 3 и 6k±1
    static bool isPrime(IntValue value);
    // Наименьшее простое больше value; nullopt, если оно не помещается в IntValue
    static std::optional<IntValue> nextPrime(IntValue value);
};

} // namespace sequence
} // namespace core
} // namespace mathmachine
