#include "core/sequence/Fibonacci.hpp"
#include <limits>
#include <optional>

namespace mathmachine {
namespace core {
namespace sequence {

IntValue Fibonacci::compute(Index n, const LookupType& lookup) const {
    if (n < 0) {
        throw SequenceError(SequenceErrc::InvalidIndex, n, name());
    }
    if (n > MAX_INDEX) {
        throw SequenceError(SequenceErrc::Overflow, n, name());
    }
    if (n < 2) {
        return static_cast<IntValue>(n);
    }

    if (lookup) {
        // Ближайшая к n пара соседних членов (k-1, k) из кэша.
        // Запросы идут сверху вниз: k-1 перед k, каждый индекс запрашивается не более одного раза
        std::optional<IntValue> upper;
        bool upperKnown = false;
        for (Index k = n - 1; k >= 1; --k) {
            const auto lower = lookup(k - 1);
            if (lower) {
                if (!upperKnown) {
                    upper = lookup(k);
                }
                if (upper) {
                    return resume(n, k, *lower, *upper);
                }
            }
            upper = lower;
            upperKnown = true;
        }
    }
    return resume(n, 1, 0, 1);
}

IntValue Fibonacci::resume(Index n, Index from, IntValue previous, IntValue current) const {
    for (Index i = from + 1; i <= n; ++i) {
        const IntValue next = add(n, current, previous);
        previous = current;
        current = next;
    }
    return current;
}

IntValue Fibonacci::add(Index n, IntValue lhs, IntValue rhs) const {
    if (lhs > std::numeric_limits<IntValue>::max() - rhs) {
        throw SequenceError(SequenceErrc::Overflow, n, name());
    }
    return lhs + rhs;
}

} // namespace sequence
} // namespace core
} // namespace mathmachine
