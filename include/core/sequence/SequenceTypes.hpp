#pragma once

#include <cstdint>
#include <functional>
#include <optional>

namespace mathmachine {
namespace core {
namespace sequence {

// Позиция в последовательности. Знаковый тип: отрицательные индексы отклоняются стратегиями
using Index = std::int64_t;

// Целочисленное значение члена последовательности
using IntValue = std::uint64_t;

// Lookup — доступ на чтение к уже вычисленным членам меньших индексов.
// Пустой Lookup означает отсутствие кэша.
template<typename Value>
using Lookup = std::function<std::optional<Value>(Index)>;

} // namespace sequence
} // namespace core
} // namespace mathmachine
