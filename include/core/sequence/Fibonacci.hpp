#pragma once

#include <string>
#include "core/sequence/ISequenceStrategy.hpp"

namespace mathmachine {
namespace core {
namespace sequence {

// Fibonacci — F(0)=0, F(1)=1, F(n)=F(n-1)+F(n-2).
// Для n >= 2 ищет через lookup ближайшую снизу пару закэшированных членов (k-1, k), начиная с
// (n-2, n-1), и продолжает итерацию от неё; без пары считает от F(0), F(1).
class Fibonacci final : public ISequenceStrategy<IntValue> {
public:
    // Наибольший индекс, член которого помещается в IntValue
    static constexpr Index MAX_INDEX = 93;

    IntValue compute(Index n, const LookupType& lookup) const override;
    std::string name() const override { return "fibonacci"; }
private:
    // F(n) итерацией от известных F(from-1) = previous, F(from) = current
    IntValue resume(Index n, Index from, IntValue previous, IntValue current) const;
    IntValue add(Index n, IntValue lhs, IntValue rhs) const;
};

} // namespace sequence
} // namespace core
} // namespace mathmachine
