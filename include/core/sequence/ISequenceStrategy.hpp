#pragma once

#include <string>
#include "core/sequence/SequenceTypes.hpp"
#include "core/sequence/SequenceError.hpp"

namespace mathmachine {
namespace core {
namespace sequence {

// ISequenceStrategy — способ вычисления N-го члена последовательности.
// Стратегия не владеет кэшем: уже вычисленные члены доступны только через lookup,
// и стратегия не должна рассчитывать на попадание.
template<typename Value>
class ISequenceStrategy {
public:
    using ValueType = Value;
    using LookupType = Lookup<Value>;
    virtual ~ISequenceStrategy() = default;
    // Вычисление члена n. Бросает SequenceError для индексов вне области и при переполнении
    virtual Value compute(Index n, const LookupType& lookup) const = 0;
    virtual std::string name() const = 0; // Имя последовательности
};

} // namespace sequence
} // namespace core
} // namespace mathmachine
