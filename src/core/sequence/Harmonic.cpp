#include "core/sequence/Harmonic.hpp"

namespace mathmachine {
namespace core {
namespace sequence {

double Harmonic::compute(Index n, const LookupType& lookup) const {
    if (n < 0) {
        throw SequenceError(SequenceErrc::InvalidIndex, n, name());
    }
    if (n == 0) {
        return 0.0;
    }

    // Суммирование всегда идёт слева направо от ближайшего закэшированного H(k),
    // поэтому значение из кэша совпадает побитно с вычисленным заново
    Index position = 0;
    double sum = 0.0;
    if (lookup) {
        for (Index k = n - 1; k >= 1; --k) {
            if (auto closest = lookup(k)) {
                position = k;
                sum = *closest;
                break;
            }
        }
    }

    for (Index k = position + 1; k <= n; ++k) {
        sum += 1.0 / static_cast<double>(k);
    }
    return sum;
}

} // namespace sequence
} // namespace core
} // namespace mathmachine
