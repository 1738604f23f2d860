#pragma once

#include <string>
#include "core/sequence/ISequenceStrategy.hpp"

namespace mathmachine {
namespace core {
namespace sequence {

// Harmonic — частичные суммы гармонического ряда: H(0)=0, H(n)=H(n-1)+1/n
class Harmonic final : public ISequenceStrategy<double> {
public:
    double compute(Index n, const LookupType& lookup) const override;
    std::string name() const override { return "harmonic"; }
};

} // namespace sequence
} // namespace core
} // namespace mathmachine
