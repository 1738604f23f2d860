#pragma once

#include <stdexcept>
#include <string>
#include "core/sequence/SequenceTypes.hpp"

namespace mathmachine {
namespace core {
namespace sequence {

// Категории ошибок предметной области
enum class SequenceErrc {
    InvalidIndex, // Индекс вне области определения последовательности
    Overflow      // Значение не помещается в тип значения
};

const char* toString(SequenceErrc code) noexcept;

// SequenceError — ошибка вычисления члена последовательности.
// Пробрасывается через lruCalculate без изменений, кэш при этом не меняется.
class SequenceError : public std::runtime_error {
public:
    SequenceError(SequenceErrc code, Index index, const std::string& sequenceName);
    SequenceErrc code() const noexcept { return code_; }
    Index index() const noexcept { return index_; }
private:
    SequenceErrc code_;
    Index index_;
};

} // namespace sequence
} // namespace core
} // namespace mathmachine
