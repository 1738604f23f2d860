#pragma once

#include <cstddef>
#include <mutex>
#include <utility>
#include "core/machine/Machine.hpp"

namespace mathmachine {
namespace core {
namespace machine {

// SynchronizedMachine — Machine за мьютексом для доступа из нескольких потоков.
// Все вычисления сериализуются: кэш и вложенные lookup не рассчитаны на параллельный доступ.
template<typename Strategy>
class SynchronizedMachine {
public:
    using ValueType = typename Strategy::ValueType;

    explicit SynchronizedMachine(Machine<Strategy> machine)
        : machine_(std::move(machine)) {
    }

    SynchronizedMachine(Strategy strategy, size_t capacity, size_t maxAge)
        : machine_(std::move(strategy), capacity, maxAge) {
    }

    ValueType calculate(sequence::Index n) {
        std::lock_guard<std::mutex> lock(mutex_);
        return lruCalculate(machine_, n);
    }

    cache::CacheMetrics getMetrics() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return machine_.getMetrics();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return machine_.cache().size();
    }

    // Глубокая копия текущего состояния под блокировкой
    Machine<Strategy> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return machine_.clone();
    }

private:
    mutable std::mutex mutex_;
    Machine<Strategy> machine_;
};

} // namespace machine
} // namespace core
} // namespace mathmachine
