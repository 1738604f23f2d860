#include "core/sequence/Primes.hpp"
#include <limits>

namespace mathmachine {
namespace core {
namespace sequence {

bool Primes::isPrime(IntValue value) {
    if (value <= 1) return false;
    if (value <= 3) return true;
    if (value % 2 == 0 || value % 3 == 0) return false;

    for (IntValue step = 5; step <= value / step; step += 6) {
        if (value % step == 0 || value % (step + 2) == 0) {
            return false;
        }
    }
    return true;
}

std::optional<IntValue> Primes::nextPrime(IntValue value) {
    constexpr IntValue limit = std::numeric_limits<IntValue>::max();
    if (value < 2) return 2;
    if (value == 2) return 3;
    if (value >= limit - 1) return std::nullopt;

    IntValue candidate = (value % 2 == 0) ? value + 1 : value + 2;
    while (!isPrime(candidate)) {
        if (candidate > limit - 2) {
            return std::nullopt;
        }
        candidate += 2;
    }
    return candidate;
}

IntValue Primes::compute(Index n, const LookupType& lookup) const {
    if (n < 1) {
        throw SequenceError(SequenceErrc::InvalidIndex, n, name());
    }

    // Поиск продолжается от ближайшего снизу закэшированного простого
    Index position = 0;
    IntValue current = 0;
    if (lookup) {
        for (Index k = n - 1; k >= 1; --k) {
            if (auto closest = lookup(k)) {
                position = k;
                current = *closest;
                break;
            }
        }
    }

    for (; position < n; ++position) {
        const auto next = nextPrime(current);
        if (!next) {
            throw SequenceError(SequenceErrc::Overflow, n, name());
        }
        current = *next;
    }
    return current;
}

} // namespace sequence
} // namespace core
} // namespace mathmachine
